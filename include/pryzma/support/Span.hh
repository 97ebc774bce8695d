#ifndef PRYZMA_SUPPORT_SPAN_HH
#define PRYZMA_SUPPORT_SPAN_HH

#include <compare>
#include <cstddef>

namespace pryzma
{
	using FileId = std::size_t;
	using FileByte = std::size_t;

	struct SourcePosition
	{
		FileByte offset = 0;

		std::size_t line = 1;
		std::size_t column = 1;

		constexpr SourcePosition() = default;
		SourcePosition(FileByte offset, std::size_t line, std::size_t column) noexcept;

		constexpr bool operator==(const SourcePosition&) const = default;
		std::strong_ordering operator<=>(const SourcePosition&) const = default;
	};

	struct SourceSpan
	{
		FileId id = 0;

		SourcePosition begin{};
		SourcePosition end{};

		SourceSpan() noexcept = default;
		SourceSpan(FileId id, SourcePosition begin, SourcePosition end) noexcept;

		[[nodiscard]] bool valid() const noexcept { return id != 0; }
		[[nodiscard]] bool empty() const noexcept { return end.offset <= begin.offset; }
		[[nodiscard]] FileByte size() const noexcept
		{
			if (end.offset < begin.offset)
				return 0;

			return end.offset - begin.offset;
		}
	};

	// Covers both spans when they share a file, otherwise keeps the first.
	[[nodiscard]] SourceSpan merge_spans(SourceSpan a, SourceSpan b) noexcept;

} // namespace pryzma

#endif /* PRYZMA_SUPPORT_SPAN_HH */
