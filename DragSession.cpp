#include "DragSession.hpp"

#include <algorithm>

namespace tabwright {

/// #define TABWRIGHT_DEBUG_DRAG

DragSession::DragSession() {}

DragSession::~DragSession() {}

bool DragSession::ClearTarget()
{
	if (!active_ || !target_.is_valid())
		return false;

	target_ = TabRef::Invalid();
	return true;
}

void DragSession::End()
{
#ifdef TABWRIGHT_DEBUG_DRAG
	if (active_) {
		tw_info("drag from %s:%d ended", qPrintable(source_.pane_id),
			source_.index);
	}
#endif
	active_ = false;
	source_ = TabRef::Invalid();
	target_ = TabRef::Invalid();
}

bool DragSession::Start(const PaneId &pane_id, const int index)
{
	if (active_) {
		tw_warn("A drag from %s:%d is still active", qPrintable(source_.pane_id),
			source_.index);
		return false;
	}

	TW_CHECK(!pane_id.isEmpty() && index >= 0);
	active_ = true;
	source_ = TabRef{pane_id, index};
	target_ = TabRef::Invalid();
#ifdef TABWRIGHT_DEBUG_DRAG
	tw_info("drag started at %s:%d", qPrintable(pane_id), index);
#endif
	return true;
}

bool DragSession::UpdateTarget(const PaneId &pane_id, const int index,
	const int tab_count)
{
	if (!active_ || pane_id.isEmpty() || index < 0)
		return false;

	const TabRef next {pane_id, std::min(index, std::max(0, tab_count))};
	if (next == target_)
		return false;

	target_ = next;
#ifdef TABWRIGHT_DEBUG_DRAG
	tw_info("target %s:%d", qPrintable(pane_id), target_.index);
#endif
	return true;
}

}
