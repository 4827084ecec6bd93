/* Quire
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "quire/log/field.hpp"
#include <boost/thread/tss.hpp>
#include <atomic>
#include <cstdint>

namespace quire::log
{

// Types.

/**
 * Per-thread stack of context frames: field sets that every Record built in that thread (by a Logger attached to
 * this store) carries in Record::m_context while the frame is on the stack.
 *
 * A frame is pushed by enter() and popped by exit(); normally one uses Context_scope, which guarantees the pairing
 * on every exit path.  The context visible at any moment is current_merged(): all frames of the calling thread
 * merged outermost to innermost, so an inner frame shadows an outer key only until the inner frame exits, at which
 * point the outer value is visible again.
 *
 * ### Thread safety ###
 * Each thread sees only its own stack, so no locking is involved, and concurrent use from any number of threads is
 * safe.  A frame must be exited in the thread that entered it (a Context_scope must not migrate between threads).
 *
 * Usually there is just the one store, default_store(), which Logger uses unless told otherwise; separate
 * instances exist mainly for test isolation.
 */
class Context_store
{
public:
  // Types.

  /// Identifies one enter() call; unique per store across threads and time.
  using Frame_token = uint64_t;

  // Constructors/destructor.

  /// Constructs store with all stacks empty.
  Context_store();

  /// Boring destructor.  Frames still on stacks are dropped.
  ~Context_store();

  /// Forbid copying.
  Context_store(const Context_store&) = delete;

  // Methods.

  /// Forbid copying.
  Context_store& operator=(const Context_store&) = delete;

  /**
   * Pushes a frame with the given fields onto the calling thread's stack.
   *
   * @param fields
   *        Fields of the new frame.
   * @return Token to pass to exit().
   */
  Frame_token enter(Fields fields);

  /**
   * Pops the calling thread's frame identified by `token`, along with any frames pushed after it and not yet
   * exited (which can only happen if enter()/exit() were paired out of order).  No-op if `token` is not on this
   * thread's stack (for example, already popped that way).
   *
   * @param token
   *        Value returned by enter() in this thread.
   */
  void exit(Frame_token token);

  /**
   * Returns the merge of the calling thread's frames, outermost first, so that innermost wins on key collision.
   * Key order: first appearance, outermost first.
   *
   * @return See above.
   */
  Fields current_merged() const;

  /**
   * Number of frames on the calling thread's stack.
   * @return See above.
   */
  size_t depth() const;

  /**
   * The process-wide store used by Logger and Context_scope by default.
   * @return See above.  Never null.
   */
  static Context_store* default_store();

private:
  // Types.

  /// One enter() worth of state.
  struct Frame
  {
    /// From enter().
    Frame_token m_token;
    /// From enter().
    Fields m_fields;
  };

  /// One thread's frames, outermost first.
  using Frame_stack = std::vector<Frame>;

  // Methods.

  /**
   * Returns the calling thread's stack, creating an empty one on first use in this thread.
   * @return See above.
   */
  Frame_stack* this_thread_stack() const;

  // Data.

  /// Each thread's stack; cleaned up by boost.thread at thread exit (or at our destruction for the calling thread).
  mutable boost::thread_specific_ptr<Frame_stack> m_this_thread_stack;

  /// Next enter() token.
  std::atomic<Frame_token> m_next_token;
}; // class Context_store

/**
 * RAII frame on a Context_store: enters on construction, exits on destruction, including destruction during stack
 * unwinding.  Movable (the moved-from object's destructor does nothing) but not copyable.  Must be destroyed in
 * the thread that constructed it.
 *
 *   ~~~
 *   {
 *     quire::log::Context_scope scope({{"request_id", "r1"}});
 *     logger->info("accepted");  // context.request_id == "r1"
 *   }
 *   logger->info("idle");        // no request_id
 *   ~~~
 */
class Context_scope
{
public:
  // Constructors/destructor.

  /**
   * Enters a frame with `fields` in `store`.
   *
   * @param fields
   *        Frame fields.
   * @param store
   *        Store; must outlive `*this`.
   */
  explicit Context_scope(Fields fields, Context_store* store = Context_store::default_store());

  /**
   * Move constructor: `*this` takes over the frame; `src_moved` becomes a no-op.
   *
   * @param src_moved
   *        Source object.
   */
  Context_scope(Context_scope&& src_moved) noexcept;

  /// Forbid copying: each frame is exited exactly once.
  Context_scope(const Context_scope&) = delete;

  /// Exits the frame, unless `*this` was moved-from.
  ~Context_scope();

  // Methods.

  /// Forbid copying.
  Context_scope& operator=(const Context_scope&) = delete;

  /// Forbid reassignment.
  Context_scope& operator=(Context_scope&&) = delete;

private:
  // Data.

  /// Store in which we entered; null if moved-from.
  Context_store* m_store_or_null;

  /// Our frame.
  Context_store::Frame_token m_token;
}; // class Context_scope

// Free functions.

/**
 * Convenience for request-handling code: enters a frame binding `request_id`, `user_id` (omitted if empty) and
 * then the fields of `extra` (which may override the former two).
 *
 * @param request_id
 *        Request identifier.
 * @param user_id
 *        User identifier, or empty if none.
 * @param extra
 *        Further fields.
 * @param store
 *        Store.
 * @return The RAII frame; keep it alive for the duration of the request.
 */
Context_scope make_request_context(util::String_view request_id, util::String_view user_id = "",
                                   const Fields& extra = Fields(),
                                   Context_store* store = Context_store::default_store());

} // namespace quire::log
