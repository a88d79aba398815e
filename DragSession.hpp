#pragma once

#include "decl.hxx"
#include "err.hpp"

namespace tabwright {

/// State of the one in-progress tab drag: Idle or Dragging(source, target?).
/// The source is fixed for the lifetime of a session, the target follows
/// the pointer and may be absent.
class DragSession {
public:
	DragSession();
	virtual ~DragSession();

	bool active() const { return active_; }
	bool ClearTarget();
	void End();
	bool has_target() const { return target_.is_valid(); }
	const TabRef& source() const { return source_; }
	bool Start(const PaneId &pane_id, const int index);
	const TabRef& target() const { return target_; }
	bool UpdateTarget(const PaneId &pane_id, const int index, const int tab_count);

	bool operator == (const DragSession &rhs) const {
		return active_ == rhs.active_ && source_ == rhs.source_
			&& target_ == rhs.target_;
	}

private:
	TabRef source_ = {};
	TabRef target_ = {};
	bool active_ = false;
};

}
