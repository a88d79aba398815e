#include "StripController.hpp"

#include "actions.hh"
#include "drop.hh"
#include "payload.hh"
#include "Store.hpp"

namespace tabwright {

/// #define TABWRIGHT_DEBUG_DRAG

StripController::StripController(Store *store, const PaneId &pane_id):
store_(store), pane_id_(pane_id)
{}

StripController::~StripController() {}

int StripController::indicator_index() const
{
	const DragSession &session = store_->drag();
	if (!session.active() || !session.has_target())
		return -1;
	
	return (session.target().pane_id == pane_id_) ? session.target().index : -1;
}

bool StripController::is_dimmed(const int index) const
{
	const DragSession &session = store_->drag();
	if (!session.active() || index < 0)
		return false;
	
	if (session.source() == TabRef{pane_id_, index})
		return true;
	
	return indicator_index() == index;
}

void StripController::OnDragEnd()
{
	store_->Dispatch(Action::New(ActionType::EndDrag));
}

bool StripController::OnDragOver(const DropPointer &pointer)
{
	cint index = drop::ResolveIndex(pointer.x, pointer.tabs, pointer.topmost);
	if (index < 0 || !pane()) {
		if (indicator_index() != -1)
			store_->Dispatch(Action::New(ActionType::ClearDragTarget));
		return false;
	}
	
	store_->Dispatch(Action::NewUpdateDragTarget(TabRef{pane_id_, index}));
	return true;
}

void StripController::OnDragLeave()
{
	if (indicator_index() != -1)
		store_->Dispatch(Action::New(ActionType::ClearDragTarget));
}

bool StripController::OnDragStart(const int index, QByteArray &payload)
{
	const Pane *p = pane();
	TW_CHECK(p && p->tabs.is_valid_index(index));
	const TabRef source {pane_id_, index};
	if (!store_->Dispatch(Action::NewStartDrag(source)))
		return false;
	
	const TabItem &item = p->tabs.at(index);
	payload::TabPayload tp;
	tp.pane_id = pane_id_;
	tp.tab_index = index;
	tp.file_path = item.path;
	tp.is_pinned = item.pinned;
	payload = payload::Encode(tp);
	
	return true;
}

bool StripController::OnDrop(const DropPointer &pointer, const QByteArray &payload)
{
	actions::DropInput in;
	in.mods = pointer.mods;
	in.drop_x = pointer.window_x;
	in.viewport_width = pointer.window_width;
	
	if (!ResolveSource(payload, in.source))
		in.source = TabRef::Invalid();
	
	cint index = drop::ResolveIndex(pointer.x, pointer.tabs, pointer.topmost);
	if (index >= 0 && pane())
		in.target = TabRef{pane_id_, index};
	
	const actions::DropDecision decision = actions::Decide(in);
#ifdef TABWRIGHT_DEBUG_DRAG
	tw_info("%s:%d -> %s:%d, %s", qPrintable(in.source.pane_id), in.source.index,
		qPrintable(in.target.pane_id), in.target.index,
		actions::DropModeName(decision.mode));
#endif
	bool applied = false;
	const Action action = actions::MakeAction(decision, in);
	if (action.type != ActionType::None)
		applied = store_->Dispatch(action);
	
	store_->Dispatch(Action::New(ActionType::EndDrag));
	return applied;
}

const Pane* StripController::pane() const
{
	return store_->leaf(pane_id_);
}

bool StripController::ResolveSource(const QByteArray &payload, TabRef &ret) const
{
	payload::TabPayload tp;
	if (payload::Decode(payload, tp)) {
		const Pane *src = store_->leaf(tp.pane_id);
		if (src) {
			const TabModel &tabs = src->tabs;
			if (tabs.is_valid_index(tp.tab_index) && tabs.at(tp.tab_index).path == tp.file_path) {
				ret = TabRef{tp.pane_id, tp.tab_index};
				return true;
			}
			/// The tab moved since the drag started.
			cint index = tabs.IndexOf(tp.file_path);
			if (index != -1) {
				ret = TabRef{tp.pane_id, index};
				return true;
			}
			tw_warn("\"%s\" is no longer open in %s", qPrintable(tp.file_path),
				qPrintable(tp.pane_id));
			return false;
		}
	}
	
	const DragSession &session = store_->drag();
	if (!session.active())
		return false;
	
	const Pane *src = store_->leaf(session.source().pane_id);
	if (!src || !src->tabs.is_valid_index(session.source().index))
		return false;
	
	ret = session.source();
	return true;
}

}
