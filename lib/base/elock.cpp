#include <lib/base/elock.h>

eSemaphore::eSemaphore()
{
	v=1;
	pthread_mutex_init(&mutex, 0);
	pthread_cond_init(&cond, 0);
}

eSemaphore::~eSemaphore()
{
	pthread_mutex_destroy(&mutex);
	pthread_cond_destroy(&cond);
}

int eSemaphore::down()
{
	int value_after_op;
	pthread_mutex_lock(&mutex);
	while (v<=0)
		pthread_cond_wait(&cond, &mutex);
	v--;
	value_after_op=v;
	pthread_mutex_unlock(&mutex);
	return value_after_op;
}

int eSemaphore::up()
{
	int value_after_op;
	pthread_mutex_lock(&mutex);
	v++;
	value_after_op=v;
	pthread_mutex_unlock(&mutex);
	pthread_cond_signal(&cond);
	return value_after_op;
}

int eSemaphore::value()
{
	int value_after_op;
	pthread_mutex_lock(&mutex);
	value_after_op=v;
	pthread_mutex_unlock(&mutex);
	return value_after_op;
}
