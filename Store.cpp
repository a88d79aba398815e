#include "Store.hpp"

#include "ByteArray.hpp"

#include <QSet>

namespace tabwright {

/// #define TABWRIGHT_DEBUG_STORE

const char* ActionTypeName(const ActionType t)
{
	switch (t) {
	case ActionType::None: return "None";
	case ActionType::SetActivePane: return "SetActivePane";
	case ActionType::OpenFile: return "OpenFile";
	case ActionType::CloseFile: return "CloseFile";
	case ActionType::TogglePin: return "TogglePin";
	case ActionType::SplitPane: return "SplitPane";
	case ActionType::MoveTab: return "MoveTab";
	case ActionType::CopyTab: return "CopyTab";
	case ActionType::SplitWithTab: return "SplitWithTab";
	case ActionType::StartDrag: return "StartDrag";
	case ActionType::UpdateDragTarget: return "UpdateDragTarget";
	case ActionType::ClearDragTarget: return "ClearDragTarget";
	case ActionType::EndDrag: return "EndDrag";
	}

	return "?";
}

static bool IsDragAction(const ActionType t)
{
	return t == ActionType::StartDrag || t == ActionType::UpdateDragTarget
		|| t == ActionType::ClearDragTarget || t == ActionType::EndDrag;
}

/// Every pane must be reached exactly once walking down from the root.
static bool IsTree(const QHash<PaneId, Pane> &panes, const PaneId &root_id)
{
	QSet<PaneId> visited;
	QVector<PaneId> pending {root_id};
	while (!pending.isEmpty()) {
		const PaneId id = pending.takeLast();
		auto it = panes.constFind(id);
		if (it == panes.constEnd()) {
			tw_warn("Unknown pane \"%s\"", qPrintable(id));
			return false;
		}
		if (visited.contains(id)) {
			tw_warn("Pane \"%s\" reached twice", qPrintable(id));
			return false;
		}
		visited.insert(id);
		pending.append(it->children);
	}

	if (visited.size() != panes.size()) {
		tw_warn("%d of %d panes unreachable from the root",
			int(panes.size() - visited.size()), int(panes.size()));
		return false;
	}

	return true;
}

Store::Store()
{
	Reset();
}

Store::~Store() {}

void Store::CollapseIfEmpty(const PaneId &id)
{
	const Pane *p = leaf(id);
	if (!p || !p->tabs.is_empty() || id == root_id_)
		return;

	const PaneId parent_id = ParentOf(id);
	TW_CHECK_VOID(!parent_id.isEmpty());

	panes_.remove(id);
	Pane &parent = panes_[parent_id];
	parent.children.removeAll(id);

	if (parent.children.size() == 1) {
		const PaneId sibling_id = parent.children[0];
		if (parent_id == root_id_)
			root_id_ = sibling_id;
		else
			ReplaceChild(parent_id, sibling_id);
		panes_.remove(parent_id);
	}

	if (active_id_ == id || !panes_.contains(active_id_))
		active_id_ = FirstLeafOf(root_id_);
}

bool Store::CopyTab(const Action &a)
{
	const Pane *src = leaf(a.source.pane_id);
	Pane *dst = leaf(a.target.pane_id);
	if (!src || !dst || !src->tabs.is_valid_index(a.source.index))
		return false;

	const QString path = src->tabs.at(a.source.index).path;
	/// Also covers copying onto the source pane itself.
	if (dst->tabs.Contains(path))
		return false;

	TW_CHECK(dst->tabs.Insert(a.target.index, TabItem{path, false}));
	dst->tabs.active_path(path);
	active_id_ = dst->id;

	return true;
}

bool Store::Deserialize(ByteArray &ba)
{
	QHash<PaneId, Pane> panes;
	TW_CHECK(ba.has_more(sizeof(i4)));
	const PaneId root_id = ba.next_string();
	const PaneId active_id = ba.next_string();
	ci4 pane_count = ba.next_i4();
	TW_CHECK(pane_count > 0);

	for (i4 i = 0; i < pane_count; i++) {
		TW_CHECK(ba.has_more());
		Pane p;
		p.id = ba.next_string();
		ci1 split = ba.next_i1();
		TW_CHECK(split >= i1(SplitOrientation::None)
			&& split <= i1(SplitOrientation::Vertical));
		p.split = SplitOrientation(split);
		ci1 child_count = ba.next_i1();
		for (i1 k = 0; k < child_count; k++)
			p.children.append(ba.next_string());

		ci4 tab_count = ba.next_i4();
		for (i4 k = 0; k < tab_count; k++) {
			TW_CHECK(ba.has_more());
			TabItem item;
			item.path = ba.next_string();
			item.pinned = ba.next_i1() == 1;
			if (!p.tabs.Insert(p.tabs.count(), item))
				tw_warn("Skipping duplicate tab \"%s\"", qPrintable(item.path));
		}
		const QString active_path = ba.next_string();
		if (p.tabs.Contains(active_path))
			p.tabs.active_path(active_path);
		else if (!p.tabs.is_empty())
			p.tabs.active_path(p.tabs.at(0).path);
		TW_CHECK(!p.id.isEmpty() && !panes.contains(p.id));
		TW_CHECK(p.children.isEmpty() || p.children.size() == 2);
		TW_CHECK(p.children.isEmpty() || p.split != SplitOrientation::None);
		panes.insert(p.id, p);
	}

	TW_CHECK(IsTree(panes, root_id));

	panes_ = panes;
	root_id_ = root_id;
	active_id_ = active_id;
	if (!leaf(active_id_))
		active_id_ = FirstLeafOf(root_id_);
	drag_.End();

	emit PanesChanged();
	return true;
}

bool Store::Dispatch(const Action &a)
{
	const bool changed = Reduce(a);
#ifdef TABWRIGHT_DEBUG_STORE
	tw_info("%s -> %s", ActionTypeName(a.type), changed ? "changed" : "no-op");
#endif
	if (!changed)
		return false;

	if (IsDragAction(a.type))
		emit DragChanged();
	else
		emit PanesChanged();

	return true;
}

PaneId Store::FirstLeafOf(const PaneId &id) const
{
	const Pane *p = pane(id);
	while (p && !p->is_leaf())
		p = pane(p->children[0]);

	return p ? p->id : PaneId();
}

PaneId Store::GenPaneId() const
{
	int max = 0;
	for (auto it = panes_.constBegin(); it != panes_.constEnd(); it++) {
		const PaneId &id = it.key();
		if (!id.startsWith(PanePrefix))
			continue;
		bool ok;
		cint n = id.mid(PanePrefix.size()).toInt(&ok);
		if (ok && n > max)
			max = n;
	}

	return PanePrefix + QString::number(max + 1);
}

const Pane* Store::leaf(const PaneId &id) const
{
	const Pane *p = pane(id);
	return (p && p->is_leaf()) ? p : nullptr;
}

Pane* Store::leaf(const PaneId &id)
{
	auto it = panes_.find(id);
	if (it == panes_.end() || !it->is_leaf())
		return nullptr;

	return &it.value();
}

QVector<PaneId> Store::LeafIds() const
{
	QVector<PaneId> ret;
	QVector<PaneId> stack = {root_id_};
	while (!stack.isEmpty()) {
		const Pane *p = pane(stack.takeLast());
		if (!p)
			continue;
		if (p->is_leaf()) {
			ret.append(p->id);
			continue;
		}
		for (int i = p->children.size() - 1; i >= 0; i--)
			stack.append(p->children[i]);
	}

	return ret;
}

bool Store::MoveTab(const Action &a)
{
	Pane *src = leaf(a.source.pane_id);
	Pane *dst = leaf(a.target.pane_id);
	if (!src || !dst || !src->tabs.is_valid_index(a.source.index) || a.target.index < 0)
		return false;

	if (src == dst) {
		if (!src->tabs.Reorder(a.source.index, a.target.index))
			return false;
		active_id_ = src->id;
		return true;
	}

	TabItem item;
	TW_CHECK(src->tabs.RemoveAt(a.source.index, &item));
	if (dst->tabs.Contains(item.path)) {
		tw_info("\"%s\" is already open in %s", qPrintable(item.path),
			qPrintable(dst->id));
	} else {
		dst->tabs.Insert(a.target.index, item);
	}

	dst->tabs.active_path(item.path);
	active_id_ = dst->id;
	CollapseIfEmpty(a.source.pane_id);

	return true;
}

const Pane* Store::pane(const PaneId &id) const
{
	auto it = panes_.constFind(id);
	return (it == panes_.constEnd()) ? nullptr : &it.value();
}

PaneId Store::ParentOf(const PaneId &id) const
{
	for (auto it = panes_.constBegin(); it != panes_.constEnd(); it++) {
		if (it->children.contains(id))
			return it.key();
	}

	return PaneId();
}

bool Store::Reduce(const Action &a)
{
	switch (a.type) {
	case ActionType::None: return false;
	case ActionType::SetActivePane: {
		if (!leaf(a.pane_id) || active_id_ == a.pane_id)
			return false;
		active_id_ = a.pane_id;
		return true;
	}
	case ActionType::OpenFile: {
		Pane *p = leaf(a.pane_id.isEmpty() ? active_id_ : a.pane_id);
		if (!p)
			return false;
		const bool was_open = p->tabs.Contains(a.path);
		const bool was_active = was_open && p->tabs.active_path() == a.path;
		if (p->tabs.Open(a.path) == -1)
			return false;
		const bool same_pane = (active_id_ == p->id);
		active_id_ = p->id;
		return !(was_active && same_pane);
	}
	case ActionType::CloseFile: {
		Pane *p = leaf(a.pane_id);
		if (!p || !p->tabs.Remove(a.path))
			return false;
		CollapseIfEmpty(a.pane_id);
		return true;
	}
	case ActionType::TogglePin: {
		Pane *p = leaf(a.pane_id);
		return p && p->tabs.TogglePin(a.path);
	}
	case ActionType::SplitPane: {
		if (!leaf(a.pane_id) || a.orientation == SplitOrientation::None)
			return false;
		active_id_ = SplitLeaf(a.pane_id, a.orientation, TabModel());
		return true;
	}
	case ActionType::MoveTab: return MoveTab(a);
	case ActionType::CopyTab: return CopyTab(a);
	case ActionType::SplitWithTab: return SplitWithTab(a);
	case ActionType::StartDrag: {
		const Pane *p = leaf(a.source.pane_id);
		if (!p || !p->tabs.is_valid_index(a.source.index))
			return false;
		return drag_.Start(a.source.pane_id, a.source.index);
	}
	case ActionType::UpdateDragTarget: {
		const Pane *p = leaf(a.target.pane_id);
		if (!p)
			return false;
		return drag_.UpdateTarget(p->id, a.target.index, p->tabs.count());
	}
	case ActionType::ClearDragTarget: return drag_.ClearTarget();
	case ActionType::EndDrag: {
		const DragSession was = drag_;
		drag_.End();
		return !(was == drag_);
	}
	}

	return false;
}

void Store::ReplaceChild(const PaneId &old_id, const PaneId &new_id)
{
	for (auto it = panes_.begin(); it != panes_.end(); it++) {
		cint index = it->children.indexOf(old_id);
		if (index != -1) {
			it->children[index] = new_id;
			return;
		}
	}
}

void Store::Reset()
{
	panes_.clear();
	Pane p;
	p.id = PanePrefix + QLatin1String("1");
	panes_.insert(p.id, p);
	root_id_ = active_id_ = p.id;
	drag_.End();
}

void Store::Serialize(ByteArray &ba) const
{
	ba.add_string(root_id_);
	ba.add_string(active_id_);
	ba.add_i4(panes_.size());

	for (const Pane &p: panes_) {
		ba.add_string(p.id);
		ba.add_i1(i1(p.split));
		ba.add_i1(p.children.size());
		for (const PaneId &child: p.children)
			ba.add_string(child);
		ba.add_i4(p.tabs.count());
		for (const TabItem &item: p.tabs.items()) {
			ba.add_string(item.path);
			ba.add_i1(item.pinned ? 1 : 0);
		}
		ba.add_string(p.tabs.active_path());
	}
}

PaneId Store::SplitLeaf(const PaneId &id, const SplitOrientation o,
	const TabModel &new_tabs)
{
	Pane new_leaf;
	new_leaf.id = GenPaneId();
	new_leaf.tabs = new_tabs;
	panes_.insert(new_leaf.id, new_leaf);

	Pane container;
	container.id = GenPaneId();
	container.split = o;
	container.children = {id, new_leaf.id};

	if (id == root_id_)
		root_id_ = container.id;
	else
		ReplaceChild(id, container.id);
	panes_.insert(container.id, container);

	return new_leaf.id;
}

bool Store::SplitWithTab(const Action &a)
{
	Pane *src = leaf(a.source.pane_id);
	const Pane *dst = leaf(a.target.pane_id);
	if (!src || !dst || !src->tabs.is_valid_index(a.source.index)
		|| a.orientation == SplitOrientation::None)
		return false;

	/// Splitting a pane's only tab off itself would leave it empty.
	if (src == dst && src->tabs.count() == 1)
		return false;

	TabItem item;
	TW_CHECK(src->tabs.RemoveAt(a.source.index, &item));
	TabModel tabs;
	tabs.Insert(0, item);
	tabs.active_path(item.path);

	active_id_ = SplitLeaf(a.target.pane_id, a.orientation, tabs);
	CollapseIfEmpty(a.source.pane_id);

	return true;
}

int Store::tab_count(const PaneId &id) const
{
	const Pane *p = leaf(id);
	return p ? p->tabs.count() : -1;
}

}
