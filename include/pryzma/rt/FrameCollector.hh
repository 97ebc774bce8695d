#ifndef PRYZMA_RT_FRAMECOLLECTOR_HH
#define PRYZMA_RT_FRAMECOLLECTOR_HH

#include <cstddef>
#include <memory>
#include <span>
#include <vector>
#include <pryzma/rt/Environment.hh>

namespace pryzma::rt
{
	// Owns no frames, only remembers the call and block frames the evaluator
	// creates. A closure stored in the frame it captures keeps that frame
	// alive through a shared_ptr cycle; collect() finds frames, lists and
	// instances that nothing outside such cycles still holds and clears them.
	//
	// Every strong reference to a tracked object is either an edge inside
	// the traced graph or an outside holder. Objects with more holders than
	// traced edges are roots, so values held by the host or by native stack
	// frames are never cleared.
	class FrameCollector
	{
	public:
		FrameCollector() = default;

		FrameCollector(FrameCollector const&) = delete;
		FrameCollector& operator=(FrameCollector const&) = delete;

		[[nodiscard]] std::shared_ptr<Environment> make_frame(std::shared_ptr<Environment> parent);

		// Returns the number of frames cleared. Frames in `closing` are being
		// torn down: they are traced like tracked frames but their own
		// holders do not make them roots.
		std::size_t collect(std::span<std::shared_ptr<Environment> const> closing = {});

		// Frames created and not yet destroyed.
		[[nodiscard]] std::size_t live_frames() const noexcept;

	private:
		void prune();

		std::vector<std::weak_ptr<Environment>> m_frames{};
		std::size_t m_prune_at{64};
	};

} // namespace pryzma::rt

#endif /* PRYZMA_RT_FRAMECOLLECTOR_HH */
