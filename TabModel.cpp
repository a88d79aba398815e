#include "TabModel.hpp"

#include <algorithm>

namespace tabwright {

TabModel::TabModel() {}

TabModel::~TabModel() {}

void TabModel::ActivateNeighborOf(const int removed_index)
{
	if (vec_.isEmpty()) {
		active_path_.clear();
		return;
	}

	cint index = std::min(removed_index, int(vec_.size()) - 1);
	active_path_ = vec_[index].path;
}

int TabModel::ClampInsertIndex(const int index, const bool pinned) const
{
	int ret = std::max(0, std::min(index, int(vec_.size())));
	cint pinned_tabs = pinned_count();

	return pinned ? std::min(ret, pinned_tabs) : std::max(ret, pinned_tabs);
}

int TabModel::IndexOf(const QString &path) const
{
	if (path.isEmpty())
		return -1;

	cint count = vec_.size();
	for (int i = 0; i < count; i++) {
		if (vec_[i].path == path)
			return i;
	}

	return -1;
}

bool TabModel::Insert(const int index, const TabItem &item)
{
	if (item.path.isEmpty() || Contains(item.path))
		return false;

	vec_.insert(ClampInsertIndex(index, item.pinned), item);
	return true;
}

int TabModel::Open(const QString &path)
{
	TW_CHECK_ARG(!path.isEmpty(), -1);
	int index = IndexOf(path);
	if (index == -1) {
		index = pinned_count();
		vec_.insert(index, TabItem{path, false});
	}

	active_path_ = path;
	return index;
}

int TabModel::pinned_count() const
{
	int n = 0;
	for (const TabItem &next: vec_) {
		if (!next.pinned)
			break;
		n++;
	}

	return n;
}

bool TabModel::Remove(const QString &path)
{
	return RemoveAt(IndexOf(path));
}

bool TabModel::RemoveAt(const int index, TabItem *ret)
{
	if (!is_valid_index(index))
		return false;

	const TabItem item = vec_.takeAt(index);
	if (item.path == active_path_)
		ActivateNeighborOf(index);

	if (ret)
		*ret = item;

	return true;
}

bool TabModel::Reorder(const int from, const int boundary)
{
	if (!is_valid_index(from))
		return false;

	cint clamped = std::max(0, std::min(boundary, int(vec_.size())));
	/// The tab leaves its slot first, so boundaries to its right move
	/// down by one.
	int to = (clamped > from) ? clamped - 1 : clamped;
	if (to == from)
		return false;

	const TabItem item = vec_.takeAt(from);
	to = ClampInsertIndex(to, item.pinned);
	vec_.insert(to, item);

	return to != from;
}

bool TabModel::TogglePin(const QString &path)
{
	cint index = IndexOf(path);
	if (index == -1)
		return false;

	TabItem item = vec_.takeAt(index);
	item.pinned = !item.pinned;
	/// Pinning appends to the pinned prefix, unpinning puts the tab
	/// first among the unpinned ones: both land at the prefix end.
	vec_.insert(pinned_count(), item);

	return true;
}

}
