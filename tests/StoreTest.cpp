#include "StoreTest.hpp"

#include "../ByteArray.hpp"
#include "../Store.hpp"

#include <QSignalSpy>

using namespace tabwright;

static QStringList PathsOf(const Store &store, const PaneId &id)
{
	QStringList ret;
	const Pane *p = store.leaf(id);
	if (!p)
		return ret;
	for (const TabItem &next: p->tabs.items())
		ret.append(next.path);
	return ret;
}

/// Opens @paths so that they end up in the given order.
static void OpenAll(Store &store, const PaneId &id, const QStringList &paths)
{
	for (int i = paths.size() - 1; i >= 0; i--)
		store.Dispatch(Action::NewOpenFile(id, paths[i]));
}

/// pane-1 with @a on the left, pane-2 with @b on the right.
static void TwoPanes(Store &store, const QStringList &a, const QStringList &b)
{
	OpenAll(store, "pane-1", a);
	QVERIFY(store.Dispatch(Action::NewSplitPane("pane-1", SplitOrientation::Horizontal)));
	QCOMPARE(store.active_pane_id(), PaneId("pane-2"));
	OpenAll(store, "pane-2", b);
}

/// One pane record in the session layout written by Store::Serialize().
static void AddPane(ByteArray &ba, const PaneId &id, const SplitOrientation split,
	const QVector<PaneId> &children, const i4 tab_count = 0)
{
	ba.add_string(id);
	ba.add_i1(i1(split));
	ba.add_i1(children.size());
	for (const PaneId &child: children)
		ba.add_string(child);
	ba.add_i4(tab_count);
	if (tab_count == 0) {
		ba.add_string(QString());
		return;
	}
	ba.add_string("/only");
	ba.add_i1(0);
}

static Action Transfer(const ActionType type, const TabRef &source,
	const TabRef &target, const SplitOrientation o = SplitOrientation::None)
{
	return Action::NewTabTransfer(type, source, target, o);
}

void StoreTest::startsWithOneEmptyPane()
{
	Store store;
	QCOMPARE(store.root_pane_id(), PaneId("pane-1"));
	QCOMPARE(store.active_pane_id(), PaneId("pane-1"));
	QCOMPARE(store.tab_count("pane-1"), 0);
	QCOMPARE(store.tab_count("pane-9"), -1);
	QVERIFY(!store.drag().active());
	
	cint n = store.Select([](const Store &s) { return s.panes().size(); });
	QCOMPARE(n, 1);
}

void StoreTest::reorderInsidePane()
{
	Store store;
	OpenAll(store, "pane-1", {"/a", "/b", "/c", "/d"});
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/a", "/b", "/c", "/d"}));
	
	QVERIFY(store.Dispatch(Transfer(ActionType::MoveTab, {"pane-1", 0}, {"pane-1", 3})));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/b", "/c", "/a", "/d"}));
	
	QVERIFY(store.Dispatch(Transfer(ActionType::MoveTab, {"pane-1", 3}, {"pane-1", 1})));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/b", "/d", "/c", "/a"}));
	
	QVERIFY(!store.Dispatch(Transfer(ActionType::MoveTab, {"pane-1", 2}, {"pane-1", 2})));
	QVERIFY(!store.Dispatch(Transfer(ActionType::MoveTab, {"pane-1", 2}, {"pane-1", 3})));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/b", "/d", "/c", "/a"}));
}

void StoreTest::moveAcrossPanes()
{
	Store store;
	TwoPanes(store, {"/a1", "/a2", "/a3"}, {"/b1", "/b2"});
	
	QVERIFY(store.Dispatch(Transfer(ActionType::MoveTab, {"pane-1", 0}, {"pane-2", 1})));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/a2", "/a3"}));
	QCOMPARE(PathsOf(store, "pane-2"), (QStringList{"/b1", "/a1", "/b2"}));
	QCOMPARE(store.active_pane_id(), PaneId("pane-2"));
	QCOMPARE(store.leaf("pane-2")->tabs.active_path(), QString("/a1"));
}

void StoreTest::moveOntoExistingPath()
{
	Store store;
	TwoPanes(store, {"/x", "/a"}, {"/b", "/x"});
	
	QVERIFY(store.Dispatch(Transfer(ActionType::MoveTab, {"pane-1", 0}, {"pane-2", 0})));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/a"}));
	QCOMPARE(PathsOf(store, "pane-2"), (QStringList{"/b", "/x"}));
	QCOMPARE(store.leaf("pane-2")->tabs.active_path(), QString("/x"));
}

void StoreTest::copyAcrossPanes()
{
	Store store;
	TwoPanes(store, {"/a1", "/a2"}, {"/b1"});
	
	QVERIFY(store.Dispatch(Transfer(ActionType::CopyTab, {"pane-1", 1}, {"pane-2", 0})));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/a1", "/a2"}));
	QCOMPARE(PathsOf(store, "pane-2"), (QStringList{"/a2", "/b1"}));
	QCOMPARE(store.leaf("pane-2")->tabs.active_path(), QString("/a2"));
	
	/// Already open there.
	QVERIFY(!store.Dispatch(Transfer(ActionType::CopyTab, {"pane-1", 1}, {"pane-2", 2})));
	QVERIFY(!store.Dispatch(Transfer(ActionType::CopyTab, {"pane-1", 0}, {"pane-1", 2})));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/a1", "/a2"}));
	QCOMPARE(PathsOf(store, "pane-2"), (QStringList{"/a2", "/b1"}));
}

void StoreTest::splitWithTab()
{
	Store store;
	TwoPanes(store, {"/a1", "/a2"}, {"/b1"});
	/// pane-3 is the container of pane-1 and pane-2
	QCOMPARE(store.root_pane_id(), PaneId("pane-3"));
	
	QVERIFY(store.Dispatch(Transfer(ActionType::SplitWithTab, {"pane-1", 1},
		{"pane-2", 0}, SplitOrientation::Horizontal)));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/a1"}));
	QCOMPARE(PathsOf(store, "pane-2"), (QStringList{"/b1"}));
	QCOMPARE(PathsOf(store, "pane-4"), (QStringList{"/a2"}));
	QCOMPARE(store.active_pane_id(), PaneId("pane-4"));
	QCOMPARE(store.ParentOf("pane-4"), PaneId("pane-5"));
	QCOMPARE(store.ParentOf("pane-5"), PaneId("pane-3"));
	QCOMPARE(store.pane("pane-5")->split, SplitOrientation::Horizontal);
	QCOMPARE(store.LeafIds(), (QVector<PaneId>{"pane-1", "pane-2", "pane-4"}));
	
	QVERIFY(!store.Dispatch(Transfer(ActionType::SplitWithTab, {"pane-1", 0},
		{"pane-2", 0}, SplitOrientation::None)));
}

void StoreTest::splitSinglePaneOntoItselfIsNoop()
{
	Store store;
	OpenAll(store, "pane-1", {"/only"});
	QVERIFY(!store.Dispatch(Transfer(ActionType::SplitWithTab, {"pane-1", 0},
		{"pane-1", 0}, SplitOrientation::Vertical)));
	QCOMPARE(store.panes().size(), 1);
	
	OpenAll(store, "pane-1", {"/second"});
	QVERIFY(store.Dispatch(Transfer(ActionType::SplitWithTab, {"pane-1", 1},
		{"pane-1", 0}, SplitOrientation::Vertical)));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/second"}));
	QCOMPARE(PathsOf(store, "pane-2"), (QStringList{"/only"}));
	QCOMPARE(store.pane(store.root_pane_id())->split, SplitOrientation::Vertical);
}

void StoreTest::emptyPaneCollapses()
{
	Store store;
	TwoPanes(store, {"/a"}, {"/b"});
	QCOMPARE(store.panes().size(), 3);
	
	QVERIFY(store.Dispatch(Transfer(ActionType::MoveTab, {"pane-2", 0}, {"pane-1", 1})));
	QCOMPARE(store.panes().size(), 1);
	QCOMPARE(store.root_pane_id(), PaneId("pane-1"));
	QCOMPARE(store.active_pane_id(), PaneId("pane-1"));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/a", "/b"}));
	
	/// The root pane stays, even when empty.
	QVERIFY(store.Dispatch(Action::NewCloseFile("pane-1", "/a")));
	QVERIFY(store.Dispatch(Action::NewCloseFile("pane-1", "/b")));
	QCOMPARE(store.tab_count("pane-1"), 0);
	QCOMPARE(store.panes().size(), 1);
}

void StoreTest::cancelledDragChangesNothing()
{
	Store store;
	TwoPanes(store, {"/a1", "/a2"}, {"/b1"});
	const QStringList left = PathsOf(store, "pane-1");
	const QStringList right = PathsOf(store, "pane-2");
	
	QVERIFY(store.Dispatch(Action::NewStartDrag({"pane-1", 0})));
	QVERIFY(store.Dispatch(Action::NewUpdateDragTarget({"pane-2", 1})));
	QVERIFY(store.Dispatch(Action::New(ActionType::EndDrag)));
	
	QVERIFY(!store.drag().active());
	QCOMPARE(PathsOf(store, "pane-1"), left);
	QCOMPARE(PathsOf(store, "pane-2"), right);
	QVERIFY(!store.Dispatch(Action::New(ActionType::EndDrag)));
}

void StoreTest::emitsChangeSignals()
{
	Store store;
	QSignalSpy panes_spy(&store, &Store::PanesChanged);
	QSignalSpy drag_spy(&store, &Store::DragChanged);
	
	store.Dispatch(Action::NewOpenFile("pane-1", "/a"));
	store.Dispatch(Action::NewOpenFile("pane-1", "/a"));
	QCOMPARE(panes_spy.count(), 1);
	
	store.Dispatch(Action::NewStartDrag({"pane-1", 0}));
	store.Dispatch(Action::NewUpdateDragTarget({"pane-1", 1}));
	store.Dispatch(Action::NewUpdateDragTarget({"pane-1", 1}));
	store.Dispatch(Action::New(ActionType::ClearDragTarget));
	store.Dispatch(Action::New(ActionType::EndDrag));
	QCOMPARE(drag_spy.count(), 4);
	QCOMPARE(panes_spy.count(), 1);
}

void StoreTest::ignoresUnknownPanes()
{
	Store store;
	OpenAll(store, "pane-1", {"/a"});
	QVERIFY(!store.Dispatch(Action::NewOpenFile("pane-7", "/b")));
	QVERIFY(!store.Dispatch(Action::NewCloseFile("pane-1", "/missing")));
	QVERIFY(!store.Dispatch(Action::NewTogglePin("pane-7", "/a")));
	QVERIFY(!store.Dispatch(Action::NewSetActivePane("pane-7")));
	QVERIFY(!store.Dispatch(Transfer(ActionType::MoveTab, {"pane-7", 0}, {"pane-1", 0})));
	QVERIFY(!store.Dispatch(Transfer(ActionType::MoveTab, {"pane-1", 5}, {"pane-1", 0})));
	QVERIFY(!store.Dispatch(Action::NewStartDrag({"pane-1", 3})));
	QVERIFY(!store.drag().active());
	QVERIFY(!store.Dispatch(Action::New(ActionType::None)));
}

void StoreTest::serializeRestoresLayout()
{
	Store store;
	TwoPanes(store, {"/a1", "/a2"}, {"/b1", "/b2"});
	store.Dispatch(Action::NewTogglePin("pane-1", "/a2"));
	store.Dispatch(Action::NewSplitPane("pane-2", SplitOrientation::Vertical));
	store.Dispatch(Action::NewSetActivePane("pane-1"));
	
	ByteArray ba;
	store.Serialize(ba);
	ba.to(0);
	
	Store restored;
	QSignalSpy spy(&restored, &Store::PanesChanged);
	QVERIFY(restored.Deserialize(ba));
	QCOMPARE(spy.count(), 1);
	QCOMPARE(restored.root_pane_id(), store.root_pane_id());
	QCOMPARE(restored.active_pane_id(), PaneId("pane-1"));
	QCOMPARE(restored.LeafIds(), store.LeafIds());
	for (const PaneId &id: store.LeafIds()) {
		QVERIFY(restored.leaf(id)->tabs.items() == store.leaf(id)->tabs.items());
		QCOMPARE(restored.leaf(id)->tabs.active_path(), store.leaf(id)->tabs.active_path());
	}
	QCOMPARE(restored.leaf("pane-1")->tabs.pinned_count(), 1);
	QCOMPARE(restored.pane(restored.ParentOf("pane-2"))->split, SplitOrientation::Vertical);
}

void StoreTest::deserializeRejectsGarbage()
{
	Store store;
	OpenAll(store, "pane-1", {"/kept"});
	
	ByteArray ba;
	ba.add_string("pane-1");
	ba.add_string("pane-1");
	ba.add_i4(2);
	ba.add_string("pane-1");
	ba.to(0);
	QVERIFY(!store.Deserialize(ba));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/kept"}));
	
	ByteArray empty;
	QVERIFY(!store.Deserialize(empty));
}

void StoreTest::deserializeRejectsCycle()
{
	Store store;
	OpenAll(store, "pane-1", {"/kept"});
	const auto H = SplitOrientation::Horizontal;
	
	{ /// pane-2 and pane-3 hold each other, pane-4 is shared.
		ByteArray ba;
		ba.add_string("pane-1");
		ba.add_string("pane-9");
		ba.add_i4(4);
		AddPane(ba, "pane-1", H, {"pane-2", "pane-4"});
		AddPane(ba, "pane-2", H, {"pane-3", "pane-4"});
		AddPane(ba, "pane-3", H, {"pane-2", "pane-4"});
		AddPane(ba, "pane-4", SplitOrientation::None, {});
		ba.to(0);
		QVERIFY(!store.Deserialize(ba));
	}
	
	{ /// pane-3 is not reachable from the root.
		ByteArray ba;
		ba.add_string("pane-1");
		ba.add_string("pane-2");
		ba.add_i4(4);
		AddPane(ba, "pane-1", H, {"pane-2", "pane-4"});
		AddPane(ba, "pane-2", SplitOrientation::None, {});
		AddPane(ba, "pane-3", SplitOrientation::None, {});
		AddPane(ba, "pane-4", SplitOrientation::None, {});
		ba.to(0);
		QVERIFY(!store.Deserialize(ba));
	}
	
	{ /// A container without an orientation.
		ByteArray ba;
		ba.add_string("pane-1");
		ba.add_string("pane-2");
		ba.add_i4(3);
		AddPane(ba, "pane-1", SplitOrientation::None, {"pane-2", "pane-3"});
		AddPane(ba, "pane-2", SplitOrientation::None, {});
		AddPane(ba, "pane-3", SplitOrientation::None, {});
		ba.to(0);
		QVERIFY(!store.Deserialize(ba));
	}
	
	{ /// Orientation out of range.
		ByteArray ba;
		ba.add_string("pane-1");
		ba.add_string("pane-1");
		ba.add_i4(1);
		AddPane(ba, "pane-1", SplitOrientation(7), {});
		ba.to(0);
		QVERIFY(!store.Deserialize(ba));
	}
	
	{ /// A huge tab count must stop at the end of the buffer.
		ByteArray ba;
		ba.add_string("pane-1");
		ba.add_string("pane-1");
		ba.add_i4(1);
		AddPane(ba, "pane-1", SplitOrientation::None, {}, 0x7FFFFFFF);
		ba.to(0);
		QVERIFY(!store.Deserialize(ba));
	}
	
	QCOMPARE(store.root_pane_id(), PaneId("pane-1"));
	QCOMPARE(PathsOf(store, "pane-1"), (QStringList{"/kept"}));
}

QTEST_GUILESS_MAIN(StoreTest)
