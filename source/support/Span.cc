#include <pryzma/support/Span.hh>

namespace pryzma
{
	SourcePosition::SourcePosition(FileByte offset, std::size_t line, std::size_t column) noexcept
		: offset(offset), line(line), column(column)
	{
	}

	SourceSpan::SourceSpan(FileId id, SourcePosition begin, SourcePosition end) noexcept
		: id(id), begin(begin), end(end)
	{
	}

	SourceSpan merge_spans(SourceSpan a, SourceSpan b) noexcept
	{
		if (a.id == 0)
			return b;
		if (b.id == 0)
			return a;
		if (a.id != b.id)
			return a;

		SourceSpan out{};
		out.id = a.id;
		out.begin = a.begin < b.begin ? a.begin : b.begin;
		out.end = a.end < b.end ? b.end : a.end;
		return out;
	}

} // namespace pryzma
