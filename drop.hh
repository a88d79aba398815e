#pragma once

#include "decl.hxx"

namespace tabwright::drop {

/// Insertion boundary in [0, tabs.size()] for a pointer at @x, or -1 when
/// the strip isn't the top-most one under the pointer.
int ResolveIndex(const int x, const QVector<TabBounds> &tabs, const bool topmost = true);

}
