/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <stdexcept>
#include <typeinfo>

#include <fmt/format.h>

namespace tipsync {

  /**
   * Base of process-wide services. Constructing a second live instance of
   * {@tparam T} throws std::logic_error. Instances are neither copyable nor
   * movable.
   */
  template <typename T>
  class Singleton {
   public:
    Singleton(const Singleton &) = delete;
    Singleton(Singleton &&) = delete;
    Singleton &operator=(const Singleton &) = delete;
    Singleton &operator=(Singleton &&) = delete;

   protected:
    Singleton() {
      if (alive_.exchange(true, std::memory_order_acq_rel)) {
        throw std::logic_error(fmt::format(
            "Instance of singleton '{}' already exists", typeid(T).name()));
      }
    }

    ~Singleton() {
      alive_.store(false, std::memory_order_release);
    }

   private:
    inline static std::atomic_bool alive_{false};
  };

}  // namespace tipsync
