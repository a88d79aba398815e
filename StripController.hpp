#pragma once

#include "DragHandler.hpp"
#include "err.hpp"

namespace tabwright {

struct Pane;

class StripController: public DragHandler {
public:
	StripController(Store *store, const PaneId &pane_id);
	virtual ~StripController();
	
	virtual bool OnDragStart(const int index, QByteArray &payload) override;
	virtual bool OnDragOver(const DropPointer &pointer) override;
	virtual bool OnDrop(const DropPointer &pointer, const QByteArray &payload) override;
	virtual void OnDragEnd() override;
	void OnDragLeave();
	
	int indicator_index() const;
	bool is_dimmed(const int index) const;
	const Pane* pane() const;
	const PaneId& pane_id() const { return pane_id_; }
	bool ResolveSource(const QByteArray &payload, TabRef &ret) const;
	Store* store() const { return store_; }
	
private:
	NO_ASSIGN_COPY_MOVE(StripController);
	
	Store *store_ = nullptr;
	PaneId pane_id_;
};

}
