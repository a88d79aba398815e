#pragma once

#include "decl.hxx"
#include "Store.hpp"

namespace tabwright::actions {

struct DropInput {
	TabRef source = {};
	TabRef target = {};
	Modifiers mods = {};
	/// Drop point and width of the top-level window, for the split side.
	int drop_x = 0;
	int viewport_width = 0;
};

struct DropDecision {
	DropMode mode = DropMode::None;
	SplitOrientation orientation = SplitOrientation::None;
	
	bool operator == (const DropDecision &rhs) const {
		return mode == rhs.mode && orientation == rhs.orientation;
	}
};

DropDecision Decide(const DropInput &in);

/// ActionType::None for DropMode::None.
Action MakeAction(const DropDecision &decision, const DropInput &in);

const char* DropModeName(const DropMode m);

}
