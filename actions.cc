#include "actions.hh"

namespace tabwright::actions {

DropDecision Decide(const DropInput &in)
{
	if (!in.source.is_valid() || !in.target.is_valid())
		return DropDecision{};
	
	if (in.mods.copy())
		return DropDecision{DropMode::Copy, SplitOrientation::None};
	
	if (in.mods.split()) {
		const bool left_half = in.drop_x < in.viewport_width / 2;
		return DropDecision{DropMode::Split, left_half
			? SplitOrientation::Horizontal : SplitOrientation::Vertical};
	}
	
	return DropDecision{DropMode::Move, SplitOrientation::None};
}

const char* DropModeName(const DropMode m)
{
	switch (m) {
	case DropMode::None: return "none";
	case DropMode::Move: return "move";
	case DropMode::Copy: return "copy";
	case DropMode::Split: return "split";
	}
	
	return "?";
}

Action MakeAction(const DropDecision &decision, const DropInput &in)
{
	switch (decision.mode) {
	case DropMode::None: return Action::New(ActionType::None);
	case DropMode::Move:
		return Action::NewTabTransfer(ActionType::MoveTab, in.source, in.target);
	case DropMode::Copy:
		return Action::NewTabTransfer(ActionType::CopyTab, in.source, in.target);
	case DropMode::Split:
		return Action::NewTabTransfer(ActionType::SplitWithTab, in.source,
			in.target, decision.orientation);
	}
	
	return Action::New(ActionType::None);
}

}
