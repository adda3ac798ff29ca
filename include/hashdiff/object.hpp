#pragma once

#include <string>

#include <json/json.h>

namespace hashdiff {

/**
 * A caller domain object tracked by a Differential.
 *
 * Id() is an opaque byte string that must stay stable for the lifetime of
 * the object; Content() is its structural content, which is what gets hashed
 * and stored as the pending payload.
 */
class Object {
 public:
  virtual ~Object() = default;

  virtual std::string Id() const = 0;
  virtual Json::Value Content() const = 0;
};

}  // namespace hashdiff
