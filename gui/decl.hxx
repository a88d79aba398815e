#pragma once

#include "../err.hpp"

namespace tabwright::gui {
class PaneView;
class PrefsPane;
class TabStrip;
class Workspace;

/// Fallback size of the main window when none was saved.
const int DefaultWindowWidth = 1000;
const int DefaultWindowHeight = 680;

} /// namespace
