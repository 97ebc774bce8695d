#ifndef PRYZMA_SUPPORT_SOURCE_MANAGER_HH
#define PRYZMA_SUPPORT_SOURCE_MANAGER_HH

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <pryzma/support/Result.hh>
#include <pryzma/support/Span.hh>

namespace pryzma
{
	// Owns the text of every file and virtual buffer seen by a session.
	// Buffers never move once added, so token lexemes may view into them.
	class SourceManager
	{
	public:
		SourceManager() = default;

		SourceManager(SourceManager const&) = delete;
		SourceManager& operator=(SourceManager const&) = delete;

		SourceManager(SourceManager&&) noexcept = default;
		SourceManager& operator=(SourceManager&&) noexcept = default;

		Result<FileId, std::string> open_read(std::string_view filename);

		FileId add_virtual(std::string name, std::string contents);

		[[nodiscard]] bool has(FileId id) const noexcept;

		[[nodiscard]] std::string_view name(FileId id) const noexcept;
		[[nodiscard]] bool is_virtual(FileId id) const noexcept;

		[[nodiscard]] std::string_view content(FileId id) const noexcept;

		[[nodiscard]] std::size_t line_count(FileId id) const noexcept;
		[[nodiscard]] std::string_view line_view(FileId id,
												 std::size_t line_1_based) const noexcept;

		[[nodiscard]] SourcePosition position_from_offset(FileId id,
														  FileByte offset) const noexcept;
		[[nodiscard]] SourceSpan
		span_from_offsets(FileId id, FileByte begin, FileByte end) const noexcept;

		[[nodiscard]] std::string_view text(SourceSpan span) const noexcept;

	private:
		struct Entry
		{
			FileId id{};
			std::string name{};
			bool is_virtual{};

			std::string buffer{};
			std::vector<FileByte> line_starts{};
		};

		[[nodiscard]] Entry const* get(FileId id) const noexcept;

		static void rebuild_line_index(Entry& e);

		FileId m_next_id{1};
		std::unordered_map<FileId, Entry> m_entries{};
	};

} // namespace pryzma

#endif /* PRYZMA_SUPPORT_SOURCE_MANAGER_HH */
