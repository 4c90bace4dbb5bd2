#pragma once

#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>

namespace junction {

template <class T>
class RequestTask;

namespace internal {

// State shared by all RequestTask promises.
// When a task awaits another one, the awaited frame records its continuation and the outermost (root) task
// records which frame is currently suspended, so that resuming the root resumes the innermost frame.
struct TaskPromiseBase {
  std::coroutine_handle<> _continuation;
  TaskPromiseBase* _pRoot{this};
  std::coroutine_handle<> _active;  // only maintained on the root
  std::exception_ptr _exception;
};

struct TaskFinalAwaiter {
  [[nodiscard]] bool await_ready() const noexcept { return false; }

  template <class Promise>
  std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) const noexcept {
    TaskPromiseBase& promise = handle.promise();
    if (promise._continuation) {
      promise._pRoot->_active = promise._continuation;
      return promise._continuation;
    }
    return std::noop_coroutine();
  }

  void await_resume() const noexcept {}
};

template <class Promise>
class TaskAwaiter {
 public:
  explicit TaskAwaiter(std::coroutine_handle<Promise> handle) noexcept : _handle(handle) {}

  [[nodiscard]] bool await_ready() const noexcept { return _handle.done(); }

  template <class AwaitingPromise>
  std::coroutine_handle<> await_suspend(std::coroutine_handle<AwaitingPromise> awaiting) noexcept {
    TaskPromiseBase& promise = _handle.promise();
    promise._continuation = awaiting;
    if constexpr (std::is_base_of_v<TaskPromiseBase, AwaitingPromise>) {
      promise._pRoot = awaiting.promise()._pRoot;
    }
    promise._pRoot->_active = _handle;
    return _handle;
  }

  auto await_resume() { return _handle.promise().consume_result(); }

 private:
  std::coroutine_handle<Promise> _handle;
};

}  // namespace internal

// Lazily started coroutine task used by endpoints, middleware and the router dispatch.
//
// - The coroutine does not run until it is resumed or awaited.
// - A task can be co_awaited from another coroutine: the awaiting frame is resumed, by symmetric transfer, as
//   soon as the awaited one completes. The awaited task must outlive the co_await expression (true for the usual
//   `co_await f(...)` on a temporary).
// - Exceptions escaping the coroutine body are captured and rethrown to whoever consumes the result.
// - Destroying (or reset()) a suspended task destroys its frame, and with it the frames of the tasks it awaits,
//   running the destructors of their locals. This is how an in-flight request is cancelled.
template <class T>
class RequestTask {
 public:
  struct promise_type : internal::TaskPromiseBase {
    RequestTask get_return_object() noexcept {
      auto handle = std::coroutine_handle<promise_type>::from_promise(*this);
      _active = handle;
      return RequestTask{handle};
    }

    std::suspend_always initial_suspend() noexcept { return {}; }
    internal::TaskFinalAwaiter final_suspend() noexcept { return {}; }

    void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) { _value = std::move(value); }

    void unhandled_exception() noexcept { _exception = std::current_exception(); }

    T&& consume_result() {
      if (_exception) {
        std::rethrow_exception(_exception);
      }
      return std::move(_value);
    }

    T _value{};
  };

  RequestTask() noexcept = default;
  explicit RequestTask(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  RequestTask(RequestTask&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  RequestTask& operator=(RequestTask&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  RequestTask(const RequestTask&) = delete;
  RequestTask& operator=(const RequestTask&) = delete;

  ~RequestTask() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  // Resumes the innermost suspended frame of this task.
  void resume() {
    if (_coro && !_coro.done()) {
      _coro.promise()._pRoot->_active.resume();
    }
  }

  // Drives the task to completion on the calling thread and returns its result (or rethrows its exception).
  T runSynchronously() {
    while (_coro && !_coro.done()) {
      resume();
    }
    return std::move(_coro.promise().consume_result());
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  [[nodiscard]] std::coroutine_handle<promise_type> release() noexcept { return std::exchange(_coro, {}); }

  auto operator co_await() & noexcept { return internal::TaskAwaiter<promise_type>(_coro); }
  auto operator co_await() && noexcept { return internal::TaskAwaiter<promise_type>(_coro); }

 private:
  std::coroutine_handle<promise_type> _coro;
};

template <>
class RequestTask<void> {
 public:
  struct promise_type : internal::TaskPromiseBase {
    RequestTask get_return_object() noexcept {
      auto handle = std::coroutine_handle<promise_type>::from_promise(*this);
      _active = handle;
      return RequestTask{handle};
    }

    std::suspend_always initial_suspend() noexcept { return {}; }
    internal::TaskFinalAwaiter final_suspend() noexcept { return {}; }

    void return_void() const noexcept {}
    void unhandled_exception() noexcept { _exception = std::current_exception(); }

    void consume_result() const {
      if (_exception) {
        std::rethrow_exception(_exception);
      }
    }
  };

  RequestTask() noexcept = default;
  explicit RequestTask(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  RequestTask(RequestTask&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  RequestTask& operator=(RequestTask&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  RequestTask(const RequestTask&) = delete;
  RequestTask& operator=(const RequestTask&) = delete;

  ~RequestTask() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  void resume() {
    if (_coro && !_coro.done()) {
      _coro.promise()._pRoot->_active.resume();
    }
  }

  void runSynchronously() {
    while (_coro && !_coro.done()) {
      resume();
    }
    if (_coro) {
      _coro.promise().consume_result();
    }
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  [[nodiscard]] std::coroutine_handle<promise_type> release() noexcept { return std::exchange(_coro, {}); }

  auto operator co_await() & noexcept { return internal::TaskAwaiter<promise_type>(_coro); }
  auto operator co_await() && noexcept { return internal::TaskAwaiter<promise_type>(_coro); }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace junction
