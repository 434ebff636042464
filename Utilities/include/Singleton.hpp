#pragma once

namespace utl {

// CRTP helper: derived classes keep their constructor private and declare
// `friend class Singleton;`.
template <typename T>
class Singleton {
 public:
  static T& instance() {
    static T inst;
    return inst;
  }

  Singleton(const Singleton&) = delete;
  Singleton& operator=(const Singleton&) = delete;

 protected:
  Singleton() = default;
  ~Singleton() = default;
};

}  // namespace utl
