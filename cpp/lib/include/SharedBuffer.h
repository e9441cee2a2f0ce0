/** \file   SharedBuffer.h
 *  \brief  Template class of a buffer that can be used to communicate safely between multiple threads.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <condition_variable>
#include <deque>
#include <mutex>


/** \brief  Implements a bounded queue that can be shared between producer and consumer threads.
 *  \note   Once the producer calls close(), consumers drain the remaining items and then get told that there are no more.
 */
template <typename ItemType>
class SharedBuffer {
    const size_t max_size_;
    std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<ItemType> buffer_;
    bool closed_;

public:
    explicit SharedBuffer(const size_t max_size): max_size_(max_size), closed_(false) { }

    bool empty() {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        return buffer_.empty();
    }

    /** \return False if the buffer has already been closed, in which case "new_item" is discarded. */
    bool push_back(ItemType new_item) {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        condition_.wait(mutex_locker, [this]() { return closed_ or buffer_.size() < max_size_; });
        if (closed_)
            return false;
        buffer_.emplace_back(std::move(new_item));
        mutex_locker.unlock();
        condition_.notify_all();
        return true;
    }

    /** \brief  Blocks until an item is available or the buffer has been closed and drained.
     *  \return False if there will be no more items.
     */
    bool pop_front(ItemType * const item) {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        condition_.wait(mutex_locker, [this]() { return closed_ or not buffer_.empty(); });
        if (buffer_.empty())
            return false;
        *item = std::move(buffer_.front());
        buffer_.pop_front();
        mutex_locker.unlock();
        condition_.notify_all();
        return true;
    }

    void close() {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        closed_ = true;
        mutex_locker.unlock();
        condition_.notify_all();
    }
};
