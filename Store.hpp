#pragma once

#include "decl.hxx"
#include "err.hpp"
#include "DragSession.hpp"
#include "TabModel.hpp"

#include <QHash>
#include <QObject>

namespace tabwright {

enum class ActionType: i1 {
	None,
	SetActivePane,
	OpenFile,
	CloseFile,
	TogglePin,
	SplitPane,
	MoveTab,
	CopyTab,
	SplitWithTab,
	StartDrag,
	UpdateDragTarget,
	ClearDragTarget,
	EndDrag,
};

const char* ActionTypeName(const ActionType t);

/// Fields used depend on @type, see the New*() helpers.
struct Action {
	ActionType type = ActionType::None;
	PaneId pane_id;
	QString path;
	TabRef source = {};
	TabRef target = {};
	SplitOrientation orientation = SplitOrientation::None;

	static Action NewSetActivePane(const PaneId &pane_id) {
		return Action {
			.type = ActionType::SetActivePane,
			.pane_id = pane_id,
		};
	}

	static Action NewOpenFile(const PaneId &pane_id, const QString &path) {
		return Action {
			.type = ActionType::OpenFile,
			.pane_id = pane_id,
			.path = path,
		};
	}

	static Action NewCloseFile(const PaneId &pane_id, const QString &path) {
		return Action {
			.type = ActionType::CloseFile,
			.pane_id = pane_id,
			.path = path,
		};
	}

	static Action NewTogglePin(const PaneId &pane_id, const QString &path) {
		return Action {
			.type = ActionType::TogglePin,
			.pane_id = pane_id,
			.path = path,
		};
	}

	static Action NewSplitPane(const PaneId &pane_id, const SplitOrientation o) {
		return Action {
			.type = ActionType::SplitPane,
			.pane_id = pane_id,
			.orientation = o,
		};
	}

	static Action NewTabTransfer(const ActionType type, const TabRef &source,
		const TabRef &target, const SplitOrientation o = SplitOrientation::None)
	{
		return Action {
			.type = type,
			.source = source,
			.target = target,
			.orientation = o,
		};
	}

	static Action NewStartDrag(const TabRef &source) {
		return Action {
			.type = ActionType::StartDrag,
			.source = source,
		};
	}

	static Action NewUpdateDragTarget(const TabRef &target) {
		return Action {
			.type = ActionType::UpdateDragTarget,
			.target = target,
		};
	}

	static Action New(const ActionType type) {
		return Action { .type = type };
	}
};

struct Pane {
	PaneId id;
	TabModel tabs;
	SplitOrientation split = SplitOrientation::None;
	/// Empty for leaves, exactly two ids for split containers.
	QVector<PaneId> children;

	bool is_leaf() const { return children.isEmpty(); }
};

/// Panes by id, the pane layout tree and the drag session. Everything is
/// changed through Dispatch(), nothing else writes to it.
class Store: public QObject {
	Q_OBJECT
public:
	Store();
	virtual ~Store();

	const PaneId& active_pane_id() const { return active_id_; }
	bool Deserialize(ByteArray &ba);
	bool Dispatch(const Action &action);
	const DragSession& drag() const { return drag_; }
	PaneId FirstLeafOf(const PaneId &id) const;
	const Pane* leaf(const PaneId &id) const;
	QVector<PaneId> LeafIds() const;
	const Pane* pane(const PaneId &id) const;
	const QHash<PaneId, Pane>& panes() const { return panes_; }
	PaneId ParentOf(const PaneId &id) const;
	void Reset();
	const PaneId& root_pane_id() const { return root_id_; }
	void Serialize(ByteArray &ba) const;
	int tab_count(const PaneId &id) const;

	template <typename F>
	auto Select(F selector) const { return selector(*this); }

Q_SIGNALS:
	void DragChanged();
	void PanesChanged();

private:
	NO_ASSIGN_COPY_MOVE(Store);

	void CollapseIfEmpty(const PaneId &id);
	bool CopyTab(const Action &a);
	PaneId GenPaneId() const;
	Pane* leaf(const PaneId &id);
	bool MoveTab(const Action &a);
	bool Reduce(const Action &a);
	void ReplaceChild(const PaneId &old_id, const PaneId &new_id);
	PaneId SplitLeaf(const PaneId &id, const SplitOrientation o, const TabModel &new_tabs);
	bool SplitWithTab(const Action &a);

	QHash<PaneId, Pane> panes_;
	PaneId root_id_;
	PaneId active_id_;
	DragSession drag_;
};

}
