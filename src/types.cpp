#include "types.hpp"

const char* param_type_name(ParamType t) {
  switch (t) {
    case ParamType::String: return "string";
    case ParamType::Number: return "number";
    case ParamType::Boolean: return "boolean";
  }
  return "string";
}
