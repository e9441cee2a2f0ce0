/** \file    ThreadUtil.h
 *  \brief   Declaration of thread-related utility functions.
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2017-2026 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <memory>
#include <mutex>
#include <stdexcept>
#include <pthread.h>
#include <semaphore.h>
#include "util.h"


namespace ThreadUtil {


/** \brief  A counting semaphore shared by all threads of the current process. */
class Semaphore {
    sem_t semaphore_;
    const unsigned initial_count_;
public:
    /** \param  initial_count  Initial value for semaphore. */
    explicit Semaphore(const unsigned initial_count = 0);

    ~Semaphore();
    void wait();
    void post();
    unsigned getInitialCount() const { return initial_count_; }

    Semaphore(const Semaphore &) = delete;
    const Semaphore &operator=(const Semaphore &) = delete;
};


/** \brief  Helper class that makes use of the C++ scope rules to ensure that a permit that has been taken from a
 *          semaphore is always returned, even when an exception is thrown.
 *  \note   The locker shares ownership of the semaphore, so the semaphore outlives a replacement by its owner for as
 *          long as permits that were taken from it are still held.
 */
class SemaphoreLocker {
    std::shared_ptr<Semaphore> semaphore_;
public:
    explicit SemaphoreLocker(const std::shared_ptr<Semaphore> &semaphore): semaphore_(semaphore) { semaphore_->wait(); }
    ~SemaphoreLocker() { semaphore_->post(); }

    SemaphoreLocker(const SemaphoreLocker &) = delete;
    const SemaphoreLocker &operator=(const SemaphoreLocker &) = delete;
};


/** \class  ThreadSafeCounter
 *  \brief  Implements a numeric counter that can safely be shared between threads.
 *  \note   Typical usage would be to create an instance of this class in some "main" thread and pass references into
 *          worker threads that call the increment and decrement operators as needed.
 */
template <typename NumericType> class ThreadSafeCounter {
    mutable std::mutex mutex_;
    NumericType counter_;
public:
    explicit ThreadSafeCounter(const NumericType initial_value = 0): counter_(initial_value) { }
    operator NumericType() const;
    NumericType operator++();
    NumericType operator--();
    NumericType operator+=(const NumericType increment);
    void reset(const NumericType new_value = 0);
};


template <typename NumericType> ThreadSafeCounter<NumericType>::operator NumericType() const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);

    return counter_;
}


template <typename NumericType> NumericType ThreadSafeCounter<NumericType>::operator++() {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    ++counter_;

    return counter_;
}


template <typename NumericType> NumericType ThreadSafeCounter<NumericType>::operator--() {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    if (unlikely(counter_ == 0))
        throw std::runtime_error("in ThreadSafeCounter::operator--: trying to decrement a zero counter!");
    --counter_;

    return counter_;
}


template <typename NumericType> NumericType ThreadSafeCounter<NumericType>::operator+=(const NumericType increment) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    counter_ += increment;

    return counter_;
}


template <typename NumericType> void ThreadSafeCounter<NumericType>::reset(const NumericType new_value) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    counter_ = new_value;
}


} // namespace ThreadUtil
