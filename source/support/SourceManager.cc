#include <algorithm>
#include <fstream>
#include <iterator>
#include <pryzma/support/SourceManager.hh>

namespace pryzma
{
	auto SourceManager::get(FileId id) const noexcept -> Entry const*
	{
		auto it = m_entries.find(id);
		if (it == m_entries.end())
			return nullptr;

		return &it->second;
	}

	void SourceManager::rebuild_line_index(Entry& e)
	{
		e.line_starts.clear();
		e.line_starts.push_back(0);

		for (FileByte i = 0; i < e.buffer.size(); ++i)
			if (e.buffer[i] == '\n')
				e.line_starts.push_back(i + 1);
	}

	Result<FileId, std::string> SourceManager::open_read(std::string_view filename)
	{
		std::ifstream in(std::string(filename), std::ios::binary);
		if (!in)
			return std::string("failed to open file for reading");

		auto entry = Entry{};
		entry.id = m_next_id++;
		entry.name = std::string(filename);
		entry.buffer.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

		if (in.bad())
			return std::string("failed to read file");

		rebuild_line_index(entry);

		auto id = entry.id;
		m_entries.emplace(id, std::move(entry));
		return id;
	}

	FileId SourceManager::add_virtual(std::string name, std::string contents)
	{
		auto entry = Entry{};
		entry.id = m_next_id++;
		entry.name = std::move(name);
		entry.is_virtual = true;
		entry.buffer = std::move(contents);
		rebuild_line_index(entry);

		auto id = entry.id;
		m_entries.emplace(id, std::move(entry));
		return id;
	}

	bool SourceManager::has(FileId id) const noexcept
	{
		return get(id) != nullptr;
	}

	std::string_view SourceManager::name(FileId id) const noexcept
	{
		auto const* e = get(id);
		if (!e)
			return {};

		return e->name;
	}

	bool SourceManager::is_virtual(FileId id) const noexcept
	{
		auto const* e = get(id);
		return e && e->is_virtual;
	}

	std::string_view SourceManager::content(FileId id) const noexcept
	{
		auto const* e = get(id);
		if (!e)
			return {};

		return e->buffer;
	}

	std::size_t SourceManager::line_count(FileId id) const noexcept
	{
		auto const* e = get(id);
		if (!e || e->buffer.empty())
			return 0;

		return e->line_starts.size();
	}

	std::string_view SourceManager::line_view(FileId id, std::size_t line_1_based) const noexcept
	{
		auto const* e = get(id);
		if (!e || e->buffer.empty() || line_1_based == 0)
			return {};

		auto idx = line_1_based - 1;
		if (idx >= e->line_starts.size())
			return {};

		auto begin = e->line_starts[idx];

		auto end = static_cast<FileByte>(e->buffer.size());
		if (idx + 1 < e->line_starts.size())
			end = e->line_starts[idx + 1];

		while (end > begin && (e->buffer[end - 1] == '\n' || e->buffer[end - 1] == '\r'))
			--end;

		return std::string_view(e->buffer.data() + begin, end - begin);
	}

	SourcePosition SourceManager::position_from_offset(FileId id, FileByte offset) const noexcept
	{
		auto const* e = get(id);
		if (!e)
			return {};

		if (e->line_starts.empty())
			return SourcePosition{offset, 1, offset + 1};

		auto off = std::min<FileByte>(offset, e->buffer.size());

		auto it = std::upper_bound(e->line_starts.begin(), e->line_starts.end(), off);
		auto line_idx = static_cast<std::size_t>(it - e->line_starts.begin());
		if (line_idx == 0)
			line_idx = 1;

		auto line_start = e->line_starts[line_idx - 1];
		return SourcePosition{off, line_idx, static_cast<std::size_t>(off - line_start) + 1};
	}

	SourceSpan
	SourceManager::span_from_offsets(FileId id, FileByte begin, FileByte end) const noexcept
	{
		return SourceSpan{id, position_from_offset(id, begin), position_from_offset(id, end)};
	}

	std::string_view SourceManager::text(SourceSpan span) const noexcept
	{
		auto buf = content(span.id);
		if (span.begin.offset > buf.size() || span.end.offset < span.begin.offset)
			return {};

		auto end = std::min<FileByte>(span.end.offset, buf.size());
		return buf.substr(span.begin.offset, end - span.begin.offset);
	}

} // namespace pryzma
