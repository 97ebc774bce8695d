#include <algorithm>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <pryzma/rt/FrameCollector.hh>
#include <pryzma/rt/Value.hh>

namespace pryzma::rt
{
	namespace
	{
		enum class NodeKind
		{
			frame,
			list,
			instance,
			function,
			block,
		};

		struct Node
		{
			long strong{};
			long traced{};
			bool reachable{};
		};

		struct WorkItem
		{
			NodeKind kind{};
			void const* ptr{};
		};

		// Two passes over the graph hanging off the tracked frames. The first
		// counts, for every object, how many of its strong references come
		// from inside the graph; the second marks everything reachable from
		// objects that have holders outside it.
		class Tracer
		{
		public:
			void add_frame(std::shared_ptr<Environment> frame, bool closing)
			{
				auto [it, fresh] = m_nodes.try_emplace(frame.get());
				if (!fresh)
					return;
				it->second.strong = closing ? 0 : static_cast<long>(frame.use_count()) - 1;
				m_kinds[frame.get()] = NodeKind::frame;
				m_work.push_back(WorkItem{NodeKind::frame, frame.get()});
				m_frames.push_back(std::move(frame));
			}

			void count_edges()
			{
				drain();
			}

			void mark_from_roots()
			{
				m_marking = true;
				for (auto& [ptr, node] : m_nodes)
				{
					if (node.strong <= node.traced)
						continue;
					node.reachable = true;
					m_work.push_back(WorkItem{m_kinds[ptr], ptr});
				}
				drain();
			}

			// Breaks every unreachable frame, list and instance.
			std::size_t sweep()
			{
				std::size_t cleared = 0;
				for (auto const& f : m_frames)
				{
					if (m_nodes[f.get()].reachable)
						continue;
					f->clear();
					++cleared;
				}
				for (auto const& l : m_lists)
					if (!m_nodes[l.get()].reachable)
						l->items.clear();
				for (auto const& i : m_instances)
					if (!m_nodes[i.get()].reachable)
						i->fields.clear();
				return cleared;
			}

		private:
			void drain()
			{
				while (!m_work.empty())
				{
					auto item = m_work.back();
					m_work.pop_back();
					scan(item);
				}
			}

			void scan(WorkItem const& item)
			{
				switch (item.kind)
				{
					case NodeKind::frame:
					{
						auto const* f = static_cast<Environment const*>(item.ptr);
						if (f->parent())
							to_frame(f->parent().get());
						f->for_each_binding([this](std::string const&, Value const& v, bool) { to_value(v); });
						break;
					}
					case NodeKind::list:
						for (auto const& v : static_cast<ListObject const*>(item.ptr)->items)
							to_value(v);
						break;
					case NodeKind::instance:
						for (auto const& v : static_cast<StructInstance const*>(item.ptr)->fields)
							to_value(v);
						break;
					case NodeKind::function:
						if (auto const& c = static_cast<FunctionObject const*>(item.ptr)->closure)
							to_frame(c.get());
						break;
					case NodeKind::block:
						if (auto const& c = static_cast<AsmObject const*>(item.ptr)->closure)
							to_frame(c.get());
						break;
				}
			}

			// Frames the collector does not track (module and global frames)
			// are outside the graph.
			void to_frame(Environment const* f)
			{
				auto it = m_nodes.find(f);
				if (it != m_nodes.end())
					follow(it->second, WorkItem{NodeKind::frame, f});
			}

			void to_value(Value const& v)
			{
				switch (v.kind())
				{
					case ValueKind::list:
						to_object(NodeKind::list, v.as_list());
						break;
					case ValueKind::instance:
						to_object(NodeKind::instance, v.as_instance());
						break;
					case ValueKind::function:
						to_object(NodeKind::function, v.as_function());
						break;
					case ValueKind::asm_block:
						to_object(NodeKind::block, v.as_asm());
						break;
					default:
						break;
				}
			}

			template <class T>
			void to_object(NodeKind kind, std::shared_ptr<T> const& p)
			{
				if (m_marking)
				{
					auto it = m_nodes.find(p.get());
					if (it != m_nodes.end())
						follow(it->second, WorkItem{kind, p.get()});
					return;
				}

				auto [it, fresh] = m_nodes.try_emplace(p.get());
				if (fresh)
				{
					it->second.strong = static_cast<long>(p.use_count());
					m_kinds[p.get()] = kind;
					m_work.push_back(WorkItem{kind, p.get()});

					if constexpr (std::is_same_v<T, ListObject>)
						m_lists.push_back(p);
					else if constexpr (std::is_same_v<T, StructInstance>)
						m_instances.push_back(p);
				}
				++it->second.traced;
			}

			void follow(Node& node, WorkItem const& item)
			{
				if (!m_marking)
				{
					++node.traced;
					return;
				}
				if (node.reachable)
					return;
				node.reachable = true;
				m_work.push_back(item);
			}

			bool m_marking{};
			std::unordered_map<void const*, Node> m_nodes{};
			std::unordered_map<void const*, NodeKind> m_kinds{};
			std::vector<WorkItem> m_work{};

			std::vector<std::shared_ptr<Environment>> m_frames{};
			std::vector<std::shared_ptr<ListObject>> m_lists{};
			std::vector<std::shared_ptr<StructInstance>> m_instances{};
		};

	} // namespace

	std::shared_ptr<Environment> FrameCollector::make_frame(std::shared_ptr<Environment> parent)
	{
		if (m_frames.size() >= m_prune_at)
			prune();

		auto frame = std::make_shared<Environment>(std::move(parent));
		m_frames.push_back(frame);
		return frame;
	}

	std::size_t FrameCollector::collect(std::span<std::shared_ptr<Environment> const> closing)
	{
		prune();
		if (m_frames.empty() && closing.empty())
			return 0;

		std::size_t cleared = 0;
		{
			Tracer tracer{};
			for (auto const& f : closing)
				if (f)
					tracer.add_frame(f, true);
			for (auto const& w : m_frames)
				if (auto f = w.lock())
					tracer.add_frame(std::move(f), false);

			tracer.count_edges();
			tracer.mark_from_roots();
			cleared = tracer.sweep();
		}

		prune();
		return cleared;
	}

	std::size_t FrameCollector::live_frames() const noexcept
	{
		return static_cast<std::size_t>(
			std::count_if(m_frames.begin(), m_frames.end(), [](auto const& w) { return !w.expired(); }));
	}

	void FrameCollector::prune()
	{
		std::erase_if(m_frames, [](auto const& w) { return w.expired(); });
		m_prune_at = std::max<std::size_t>(64, m_frames.size() * 2);
	}

} // namespace pryzma::rt
