#include "drop.hh"

namespace tabwright::drop {

int ResolveIndex(const int x, const QVector<TabBounds> &tabs, const bool topmost)
{
	cint count = tabs.size();
	if (count == 0)
		return 0;
	
	if (!topmost)
		return -1;
	
	if (x < tabs[0].mid())
		return 0;
	
	/// A pointer exactly on a midpoint or on a shared edge inserts after
	/// the tab whose trailing half it touches, so a still pointer never
	/// flips between two indices.
	for (int i = 1; i < count; i++) {
		if (x < tabs[i].mid())
			return i;
	}
	
	return count;
}

}
