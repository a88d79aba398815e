#pragma once

#include "decl.hxx"
#include "err.hpp"

#include <QVector>

namespace tabwright {

struct TabItem {
	QString path;
	bool pinned = false;

	bool operator == (const TabItem &rhs) const {
		return path == rhs.path && pinned == rhs.pinned;
	}
};

/// Ordered tabs of one pane. Paths are unique and pinned tabs
/// always form a prefix of the list.
class TabModel {
public:
	TabModel();
	virtual ~TabModel();

	const QString& active_path() const { return active_path_; }
	void active_path(const QString &s) { active_path_ = s; }
	int active_index() const { return IndexOf(active_path_); }

	const TabItem& at(const int index) const { return vec_[index]; }
	int ClampInsertIndex(const int index, const bool pinned) const;
	bool Contains(const QString &path) const { return IndexOf(path) != -1; }
	int count() const { return vec_.size(); }
	int IndexOf(const QString &path) const;
	bool Insert(const int index, const TabItem &item);
	bool is_empty() const { return vec_.isEmpty(); }
	bool is_valid_index(const int index) const { return index >= 0 && index < vec_.size(); }
	const QVector<TabItem>& items() const { return vec_; }
	int Open(const QString &path);
	int pinned_count() const;
	bool Remove(const QString &path);
	bool RemoveAt(const int index, TabItem *ret = nullptr);
	bool Reorder(const int from, const int boundary);
	bool TogglePin(const QString &path);

private:
	void ActivateNeighborOf(const int removed_index);

	QVector<TabItem> vec_;
	QString active_path_;
};

}
