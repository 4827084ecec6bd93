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
#include "quire/log/context_store.hpp"
#include <algorithm>

namespace quire::log
{

// Context_store implementations.

Context_store::Context_store() :
  m_next_token(1)
{
  // Nothing.
}

Context_store::~Context_store() = default;

Context_store::Frame_token Context_store::enter(Fields fields)
{
  const auto token = m_next_token++;
  this_thread_stack()->push_back({ token, std::move(fields) });
  return token;
}

void Context_store::exit(Frame_token token)
{
  auto& stack = *(this_thread_stack());
  const auto it = std::find_if(stack.begin(), stack.end(),
                               [&](const Frame& frame) -> bool { return frame.m_token == token; });
  // Everything from the frame up; nothing at all if it's not here.
  stack.erase(it, stack.end());
}

Fields Context_store::current_merged() const
{
  Fields merged;
  for (const auto& frame : *(this_thread_stack()))
  {
    merged.merge(frame.m_fields);
  }
  return merged;
}

size_t Context_store::depth() const
{
  return this_thread_stack()->size();
}

Context_store::Frame_stack* Context_store::this_thread_stack() const
{
  auto stack = m_this_thread_stack.get();
  if (!stack)
  {
    stack = new Frame_stack;
    m_this_thread_stack.reset(stack);
  }
  return stack;
}

Context_store* Context_store::default_store() // Static.
{
  // Initialized on first use, thread-safely.
  static Context_store s_default_store;
  return &s_default_store;
}

// Context_scope implementations.

Context_scope::Context_scope(Fields fields, Context_store* store) :
  m_store_or_null(store),
  m_token(m_store_or_null->enter(std::move(fields)))
{
  // Nothing.
}

Context_scope::Context_scope(Context_scope&& src_moved) noexcept :
  m_store_or_null(src_moved.m_store_or_null),
  m_token(src_moved.m_token)
{
  src_moved.m_store_or_null = nullptr;
}

Context_scope::~Context_scope()
{
  if (m_store_or_null)
  {
    m_store_or_null->exit(m_token);
  }
  // else { Moved-from.  No-op. }
}

// Free function implementations.

Context_scope make_request_context(util::String_view request_id, util::String_view user_id,
                                   const Fields& extra, Context_store* store)
{
  Fields fields{ { "request_id", request_id } };
  if (!user_id.empty())
  {
    fields.set("user_id", user_id);
  }
  fields.merge(extra);
  return Context_scope(std::move(fields), store);
}

} // namespace quire::log
