#pragma once

namespace tabwright {

template <class A_Type> class AutoDeleteArr {
public:
	AutoDeleteArr(A_Type x) : x_(x) {}
	virtual ~AutoDeleteArr() { delete [] x_; x_ = nullptr; }

private:
	A_Type x_ = nullptr;
};

}
