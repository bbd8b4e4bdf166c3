#ifndef __smartptr_h
#define __smartptr_h

template<class T>
class ePtr
{
protected:
	T *ptr;
public:
	T &operator*() { return *ptr; }
	ePtr(): ptr(0)
	{
	}
	ePtr(T *c): ptr(c)
	{
		if (c)
			c->AddRef();
	}
	ePtr(const ePtr &c): ptr(c.ptr)
	{
		if (ptr)
			ptr->AddRef();
	}
	ePtr &operator=(T *c)
	{
		if (c)
			c->AddRef();
		if (ptr)
			ptr->Release();
		ptr=c;
		return *this;
	}
	ePtr &operator=(const ePtr<T> &c)
	{
		if (c.ptr)
			c.ptr->AddRef();
		if (ptr)
			ptr->Release();
		ptr=c.ptr;
		return *this;
	}
	~ePtr()
	{
		if (ptr)
			ptr->Release();
	}
	T* &ptrref() { return ptr; }
	operator bool() const { return !!this->ptr; }
	T* operator->() const { return ptr; }
	operator T*() const { return this->ptr; }
};

#endif
