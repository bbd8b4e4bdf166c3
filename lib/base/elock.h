#ifndef __lib_base_elock_h
#define __lib_base_elock_h

#include <pthread.h>

class singleLock
{
	pthread_mutex_t &lock;
public:
	singleLock(pthread_mutex_t &m )
		:lock(m)
	{
		pthread_mutex_lock(&lock);
	}
	~singleLock()
	{
		pthread_mutex_unlock(&lock);
	}
};

class eSingleLock
{
protected:
	pthread_mutex_t m_lock;
private:
	eSingleLock(const eSingleLock &);
public:
	eSingleLock()
	{
		pthread_mutex_init(&m_lock, 0);
	}
	~eSingleLock()
	{
		pthread_mutex_destroy(&m_lock);
	}
	void lock()
	{
		pthread_mutex_lock(&m_lock);
	}
	void unlock()
	{
		pthread_mutex_unlock(&m_lock);
	}
	operator pthread_mutex_t&() { return m_lock; }
};

class eSingleLocker
{
protected:
	eSingleLock &m_lock;
public:
	eSingleLocker(eSingleLock &m)
		: m_lock(m)
	{
		m_lock.lock();
	}
	~eSingleLocker()
	{
		m_lock.unlock();
	}
};

class eSemaphore
{
	int v;
	pthread_mutex_t mutex;
	pthread_cond_t cond;
public:
	eSemaphore();
	~eSemaphore();

	int down();
	int up();
	int value();
};

#endif
