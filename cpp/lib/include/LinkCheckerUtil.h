/** \file   LinkCheckerUtil.h
 *  \brief  Threading primitives shared by the link checker's components.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <pthread.h>
#include "ThreadUtil.h"
#include "util.h"


namespace LinkChecker {


namespace Util {


// Runs a payload on its own thread. Tasklets are self-contained in that they host their
// own copy of inputs and outputs and maintain their own state.
template <typename Parameter, typename Result>
class Tasklet {
public:
    enum Status { NOT_STARTED, RUNNING, COMPLETED_SUCCESS, COMPLETED_ERROR };

private:
    static void *ThreadRoutine(void *parameter);

    const std::string description_;
    ::pthread_t thread_id_;
    mutable std::mutex mutex_;
    Status status_;
    bool joined_;
    Logger * const logger_;

    // Incremented by one for the duration of the task.
    ThreadUtil::ThreadSafeCounter<unsigned> * const running_instance_counter_;

    std::function<void(const Parameter &, Result * const)> runnable_;
    const Parameter parameter_;
    std::unique_ptr<Result> result_;

    inline void setStatus(const Status new_status) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = new_status;
    }

public:
    Tasklet(ThreadUtil::ThreadSafeCounter<unsigned> * const running_instance_counter, const std::string &description,
            const std::function<void(const Parameter &, Result * const)> &runnable, std::unique_ptr<Result> default_result,
            const Parameter &parameter, Logger * const logger = ::logger)
        : description_(description), status_(NOT_STARTED), joined_(false), logger_(logger),
          running_instance_counter_(running_instance_counter), runnable_(runnable), parameter_(parameter),
          result_(std::move(default_result)) { }
    ~Tasklet() { await(); }

    Tasklet(const Tasklet &) = delete;
    const Tasklet &operator=(const Tasklet &) = delete;

    // Spins up a new thread and executes the payload.
    void start();

    inline const std::string &toString() const { return description_; }
    inline Status getStatus() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }
    inline const Parameter &getParameter() const { return parameter_; }

    // Blocks the calling thread until the task has run to completion.
    void await();

    // Blocks until the tasklet is complete, then relinquishes ownership of the result.
    // Returns nullptr if the payload failed or the result has already been yielded.
    std::unique_ptr<Result> getResult();
};


template <typename Parameter, typename Result>
void *Tasklet<Parameter, Result>::ThreadRoutine(void *parameter) {
    Tasklet<Parameter, Result> * const tasklet(reinterpret_cast<Tasklet<Parameter, Result> *>(parameter));
    ++(*tasklet->running_instance_counter_);

    Status completion_status(COMPLETED_SUCCESS);
    try {
        tasklet->runnable_(tasklet->parameter_, tasklet->result_.get());
    } catch (const std::exception &exception) {
        LOG_WARNING_TO(tasklet->logger_, "exception in tasklet \"" + tasklet->description_ + "\": " + exception.what());
        completion_status = COMPLETED_ERROR;
    }

    --(*tasklet->running_instance_counter_);
    tasklet->setStatus(completion_status);

    return nullptr;
}


template <typename Parameter, typename Result>
void Tasklet<Parameter, Result>::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (unlikely(status_ != NOT_STARTED))
        throw std::runtime_error("in Tasklet::start: tasklet \"" + description_ + "\" has already been started!");

    status_ = RUNNING;
    const int error_code(::pthread_create(&thread_id_, nullptr, ThreadRoutine, this));
    if (unlikely(error_code != 0)) {
        status_ = NOT_STARTED;
        throw std::runtime_error("in Tasklet::start: thread creation failed for tasklet \"" + description_ + "\" ("
                                 + std::string(std::strerror(error_code)) + ")!");
    }
}


template <typename Parameter, typename Result>
void Tasklet<Parameter, Result>::await() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (status_ == NOT_STARTED or joined_)
        return;

    // The thread routine takes "mutex_" to record its status, so we must not hold it while joining.
    joined_ = true;
    const ::pthread_t thread_id(thread_id_);
    lock.unlock();
    const int error_code(::pthread_join(thread_id, nullptr));
    if (unlikely(error_code != 0))
        LOG_WARNING_TO(logger_, "failed to join tasklet \"" + description_ + "\" (" + std::string(std::strerror(error_code)) + ")!");
}


template <typename Parameter, typename Result>
std::unique_ptr<Result> Tasklet<Parameter, Result>::getResult() {
    await();

    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != COMPLETED_SUCCESS)
        return nullptr;
    return std::move(result_);
}


// Maps keys to values that are computed at most once per key.  Callers that ask for a key whose
// value is still being computed by another thread wait for that computation instead of starting
// their own.  Once stored, a value never changes.
template <typename Value>
class SingleFlightMap {
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::unordered_map<std::string, Value> values_;
    std::unordered_set<std::string> pending_keys_;

public:
    // Returns the value for "key", calling "compute" if no other caller has done so yet.
    // If "compute" throws, the key is released so that a later caller can try again.
    Value get(const std::string &key, const std::function<Value()> &compute);

    bool lookup(const std::string &key, Value * const value) const;

    // Stores "value" unless a value or a pending computation already exists for "key".
    // Returns the value that is in effect after the call.
    Value insertIfAbsent(const std::string &key, const Value &value);

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }
};


template <typename Value>
Value SingleFlightMap<Value>::get(const std::string &key, const std::function<Value()> &compute) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this, &key]() { return pending_keys_.find(key) == pending_keys_.end(); });

    const auto key_and_value(values_.find(key));
    if (key_and_value != values_.end())
        return key_and_value->second;

    pending_keys_.emplace(key);
    lock.unlock();

    Value value;
    try {
        value = compute();
    } catch (...) {
        lock.lock();
        pending_keys_.erase(key);
        lock.unlock();
        condition_.notify_all();
        throw;
    }

    lock.lock();
    values_.emplace(key, value);
    pending_keys_.erase(key);
    lock.unlock();
    condition_.notify_all();

    return value;
}


template <typename Value>
bool SingleFlightMap<Value>::lookup(const std::string &key, Value * const value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key_and_value(values_.find(key));
    if (key_and_value == values_.end())
        return false;

    *value = key_and_value->second;
    return true;
}


template <typename Value>
Value SingleFlightMap<Value>::insertIfAbsent(const std::string &key, const Value &value) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this, &key]() { return pending_keys_.find(key) == pending_keys_.end(); });
    return values_.emplace(key, value).first->second;
}


} // namespace Util


} // namespace LinkChecker
