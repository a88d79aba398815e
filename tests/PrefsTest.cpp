#include "PrefsTest.hpp"

#include "../Prefs.hpp"
#include "../Store.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace tabwright;

void PrefsTest::missingFileKeepsDefaults()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	
	Prefs prefs(dir.path());
	QVERIFY(!prefs.Load());
	QVERIFY(prefs.restore_session());
	QVERIFY(prefs.show_drag_preview());
	QVERIFY(prefs.remember_window_size());
	QCOMPARE(prefs.drop_indicator_width(), i2(2));
	QCOMPARE(prefs.window_size(), QSize(-1, -1));
	
	Store store;
	QVERIFY(!prefs.LoadSession(store));
}

void PrefsTest::saveAndLoad()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	
	Prefs prefs(dir.path());
	prefs.restore_session(false);
	prefs.show_drag_preview(false);
	prefs.drag_preview_opacity(0.5f);
	prefs.dimmed_tab_opacity(0.25f);
	prefs.drop_indicator_width(4);
	prefs.window_size(QSize(800, 600));
	QVERIFY(prefs.Save());
	QVERIFY(QFile::exists(dir.filePath(prefs::GetPrefsFileName())));
	QVERIFY(!QFile::exists(dir.filePath(prefs::GetPrefsFileName() + ".tmp_tabwright")));
	
	Prefs loaded(dir.path());
	QVERIFY(loaded.Load());
	QVERIFY(!loaded.restore_session());
	QVERIFY(!loaded.show_drag_preview());
	QVERIFY(loaded.remember_window_size());
	QCOMPARE(loaded.drag_preview_opacity(), 0.5f);
	QCOMPARE(loaded.dimmed_tab_opacity(), 0.25f);
	QCOMPARE(loaded.drop_indicator_width(), i2(4));
	QCOMPARE(loaded.window_size(), QSize(800, 600));
	
	const Prefs defaults = loaded.Defaults();
	QVERIFY(defaults.restore_session());
	QCOMPARE(defaults.drop_indicator_width(), i2(2));
}

void PrefsTest::settersClamp()
{
	Prefs prefs(QDir::tempPath());
	prefs.drop_indicator_width(40);
	QCOMPARE(prefs.drop_indicator_width(), i2(8));
	prefs.drop_indicator_width(0);
	QCOMPARE(prefs.drop_indicator_width(), i2(1));
	prefs.drag_preview_opacity(3.0f);
	QCOMPARE(prefs.drag_preview_opacity(), 1.0f);
	prefs.dimmed_tab_opacity(0.0f);
	QCOMPARE(prefs.dimmed_tab_opacity(), 0.1f);
}

void PrefsTest::unknownTrailingBytesSurvive()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	const QString path = dir.filePath(prefs::GetPrefsFileName());
	
	Prefs prefs(dir.path());
	QVERIFY(prefs.Save());
	{
		QFile file(path);
		QVERIFY(file.open(QIODevice::Append));
		QCOMPARE(file.write("future"), qint64(6));
	}
	
	Prefs newer(dir.path());
	QVERIFY(newer.Load());
	newer.drop_indicator_width(3);
	QVERIFY(newer.Save());
	
	QFile file(path);
	QVERIFY(file.open(QIODevice::ReadOnly));
	QVERIFY(file.readAll().endsWith("future"));
	
	Prefs again(dir.path());
	QVERIFY(again.Load());
	QCOMPARE(again.drop_indicator_width(), i2(3));
}

void PrefsTest::sessionRoundTrip()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	Prefs prefs(dir.path());
	
	Store store;
	store.Dispatch(Action::NewOpenFile("pane-1", "/b"));
	store.Dispatch(Action::NewOpenFile("pane-1", "/a"));
	store.Dispatch(Action::NewSplitPane("pane-1", SplitOrientation::Vertical));
	store.Dispatch(Action::NewOpenFile("pane-2", "/c"));
	QVERIFY(prefs.SaveSession(store));
	
	Store restored;
	QVERIFY(prefs.LoadSession(restored));
	QCOMPARE(restored.LeafIds(), (QVector<PaneId>{"pane-1", "pane-2"}));
	QCOMPARE(restored.active_pane_id(), PaneId("pane-2"));
	QCOMPARE(restored.tab_count("pane-1"), 2);
	QCOMPARE(restored.leaf("pane-1")->tabs.at(0).path, QString("/a"));
	QCOMPARE(restored.leaf("pane-2")->tabs.active_path(), QString("/c"));
	QCOMPARE(restored.pane(restored.root_pane_id())->split, SplitOrientation::Vertical);
}

void PrefsTest::brokenSessionResetsStore()
{
	QTemporaryDir dir;
	QVERIFY(dir.isValid());
	{
		QFile file(dir.filePath(prefs::GetSessionFileName()));
		QVERIFY(file.open(QIODevice::WriteOnly));
		const char bytes[] = {1, 0, 'x', 'y', 'z'};
		QCOMPARE(file.write(bytes, sizeof bytes), qint64(sizeof bytes));
	}
	
	Prefs prefs(dir.path());
	Store store;
	store.Dispatch(Action::NewOpenFile("pane-1", "/a"));
	QVERIFY(!prefs.LoadSession(store));
	QCOMPARE(store.panes().size(), 1);
	QCOMPARE(store.tab_count("pane-1"), 0);
}

QTEST_GUILESS_MAIN(PrefsTest)
