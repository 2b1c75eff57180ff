#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "builtins.hpp"
#include "proba/script/interpreter.hpp"
#include "proba/script/runtime_value.hpp"

namespace proba::script::builtins {

namespace {

using Args = std::span<const RuntimeValue>;
using MethodTable = std::unordered_map<std::string_view, NativeFunction>;

auto ThisArray(
    Interpreter& interp, const RuntimeValue& self, std::string_view method)
    -> Object& {
  Object* object = AsObject(self);
  if (object == nullptr || !object->IsArray()) {
    interp.ThrowError(
        ErrorKind::kTypeError,
        std::format("Array.prototype.{} called on non-array", method));
  }
  return *object;
}

void CheckWritable(Interpreter& interp, const Object& array) {
  if (array.frozen) {
    interp.ThrowError(ErrorKind::kTypeError, "Cannot modify a frozen array");
  }
}

// Calls `callback(element, index, array)` for each index present at the
// start; elements appended by the callback are not visited.
template <typename Visit>
void ForEachElement(
    Interpreter& interp, const RuntimeValue& self, Object& array,
    const RuntimeValue& callback, const RuntimeValue& this_arg, Visit visit) {
  RequireCallable(interp, callback);
  size_t length = array.elements.size();
  for (size_t i = 0; i < length && i < array.elements.size(); ++i) {
    RuntimeValue element = array.elements[i];
    std::vector<RuntimeValue> args = {element, static_cast<double>(i), self};
    RuntimeValue result = interp.Call(callback, this_arg, args);
    if (!visit(i, element, result)) {
      return;
    }
  }
}

// `open` holds the arrays currently being flattened.
void Flatten(
    Interpreter& interp, const std::vector<RuntimeValue>& elements,
    double depth, std::vector<const Object*>& open,
    std::vector<RuntimeValue>& out) {
  for (const auto& element : elements) {
    interp.Tick();
    Object* inner = AsObject(element);
    if (inner != nullptr && inner->IsArray() && depth >= 1) {
      // A cycle only ends when the depth runs out.
      if (std::isinf(depth) &&
          std::ranges::find(open, inner) != open.end()) {
        interp.ThrowError(
            ErrorKind::kRangeError, "Maximum call stack size exceeded");
      }
      interp.CheckValueDepth(open.size());
      open.push_back(inner);
      Flatten(interp, inner->elements, depth - 1, open, out);
      open.pop_back();
    } else {
      out.push_back(element);
    }
    interp.CheckArrayLength(out.size());
  }
}

auto DefaultCompare(const RuntimeValue& a, const RuntimeValue& b) -> bool {
  // undefined sorts last; everything else by string form.
  if (IsUndefined(a) || IsUndefined(b)) {
    return !IsUndefined(a) && IsUndefined(b);
  }
  return ToString(a) < ToString(b);
}

// Stable bottom-up merge sort. Indices never depend on what `less` returns,
// so a comparator that contradicts itself still yields a permutation.
template <typename Less>
void MergeSort(std::vector<RuntimeValue>& values, Less less) {
  size_t size = values.size();
  std::vector<RuntimeValue> buffer(size);
  for (size_t width = 1; width < size; width *= 2) {
    for (size_t lo = 0; lo < size; lo += 2 * width) {
      size_t mid = std::min(lo + width, size);
      size_t hi = std::min(lo + 2 * width, size);
      size_t left = lo;
      size_t right = mid;
      size_t out = lo;
      while (left < mid && right < hi) {
        if (less(values[right], values[left])) {
          buffer[out++] = std::move(values[right++]);
        } else {
          buffer[out++] = std::move(values[left++]);
        }
      }
      while (left < mid) {
        buffer[out++] = std::move(values[left++]);
      }
      while (right < hi) {
        buffer[out++] = std::move(values[right++]);
      }
    }
    values.swap(buffer);
  }
}

auto BuildArrayMethods() -> MethodTable {
  MethodTable table;

  table["push"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "push");
    CheckWritable(interp, array);
    interp.CheckArrayLength(array.elements.size() + args.size());
    array.elements.insert(array.elements.end(), args.begin(), args.end());
    return static_cast<double>(array.elements.size());
  };
  table["pop"] = [](Interpreter& interp, const RuntimeValue& self, Args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "pop");
    CheckWritable(interp, array);
    if (array.elements.empty()) {
      return Undefined{};
    }
    RuntimeValue last = std::move(array.elements.back());
    array.elements.pop_back();
    return last;
  };
  table["shift"] = [](Interpreter& interp, const RuntimeValue& self, Args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "shift");
    CheckWritable(interp, array);
    if (array.elements.empty()) {
      return Undefined{};
    }
    RuntimeValue first = std::move(array.elements.front());
    array.elements.erase(array.elements.begin());
    return first;
  };
  table["unshift"] = [](Interpreter& interp, const RuntimeValue& self,
                        Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "unshift");
    CheckWritable(interp, array);
    interp.CheckArrayLength(array.elements.size() + args.size());
    array.elements.insert(array.elements.begin(), args.begin(), args.end());
    return static_cast<double>(array.elements.size());
  };
  table["slice"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "slice");
    size_t length = array.elements.size();
    size_t start = ToRelativeIndex(Arg(args, 0), length, 0);
    size_t end = ToRelativeIndex(Arg(args, 1), length, length);
    std::vector<RuntimeValue> out;
    if (start < end) {
      out.assign(
          array.elements.begin() + static_cast<std::ptrdiff_t>(start),
          array.elements.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return interp.NewArray(std::move(out));
  };
  table["splice"] = [](Interpreter& interp, const RuntimeValue& self,
                       Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "splice");
    CheckWritable(interp, array);
    size_t length = array.elements.size();
    size_t start = ToRelativeIndex(Arg(args, 0), length, 0);
    size_t count = length - start;
    if (args.empty()) {
      count = 0;
    } else if (args.size() >= 2) {
      double requested = ToNumber(args[1]);
      if (std::isnan(requested) || requested < 0) {
        requested = 0;
      }
      count = static_cast<size_t>(
          std::min(std::trunc(requested), static_cast<double>(count)));
    }
    auto first = array.elements.begin() + static_cast<std::ptrdiff_t>(start);
    auto last = first + static_cast<std::ptrdiff_t>(count);
    std::vector<RuntimeValue> removed(first, last);
    array.elements.erase(first, last);
    if (args.size() > 2) {
      interp.CheckArrayLength(array.elements.size() + args.size() - 2);
      array.elements.insert(
          array.elements.begin() + static_cast<std::ptrdiff_t>(start),
          args.begin() + 2, args.end());
    }
    return interp.NewArray(std::move(removed));
  };
  table["concat"] = [](Interpreter& interp, const RuntimeValue& self,
                       Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "concat");
    std::vector<RuntimeValue> out = array.elements;
    for (const auto& arg : args) {
      Object* other = AsObject(arg);
      if (other != nullptr && other->IsArray()) {
        out.insert(out.end(), other->elements.begin(), other->elements.end());
      } else {
        out.push_back(arg);
      }
    }
    return interp.NewArray(std::move(out));
  };
  table["join"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "join");
    std::string separator =
        IsUndefined(Arg(args, 0)) ? std::string(",") : ToString(args[0]);
    std::string out;
    for (size_t i = 0; i < array.elements.size(); ++i) {
      if (i > 0) {
        out += separator;
      }
      if (!IsNullish(array.elements[i])) {
        out += ToString(array.elements[i]);
      }
      interp.CheckStringLength(out.size());
    }
    return out;
  };
  table["toString"] = [](Interpreter&, const RuntimeValue& self, Args)
      -> RuntimeValue { return ToString(self); };
  table["reverse"] = [](Interpreter& interp, const RuntimeValue& self, Args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "reverse");
    CheckWritable(interp, array);
    std::ranges::reverse(array.elements);
    return self;
  };
  table["indexOf"] = [](Interpreter& interp, const RuntimeValue& self,
                        Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "indexOf");
    size_t from =
        ToRelativeIndex(Arg(args, 1), array.elements.size(), 0);
    for (size_t i = from; i < array.elements.size(); ++i) {
      if (StrictEquals(array.elements[i], Arg(args, 0))) {
        return static_cast<double>(i);
      }
    }
    return -1.0;
  };
  table["lastIndexOf"] = [](Interpreter& interp, const RuntimeValue& self,
                            Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "lastIndexOf");
    for (size_t i = array.elements.size(); i > 0; --i) {
      if (StrictEquals(array.elements[i - 1], Arg(args, 0))) {
        return static_cast<double>(i - 1);
      }
    }
    return -1.0;
  };
  table["includes"] = [](Interpreter& interp, const RuntimeValue& self,
                         Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "includes");
    size_t from =
        ToRelativeIndex(Arg(args, 1), array.elements.size(), 0);
    for (size_t i = from; i < array.elements.size(); ++i) {
      if (SameValueZero(array.elements[i], Arg(args, 0))) {
        return true;
      }
    }
    return false;
  };
  table["at"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "at");
    double index = std::trunc(ToNumber(Arg(args, 0)));
    if (std::isnan(index)) {
      index = 0;
    }
    auto length = static_cast<double>(array.elements.size());
    if (index < 0) {
      index += length;
    }
    if (index < 0 || index >= length) {
      return Undefined{};
    }
    return array.elements[static_cast<size_t>(index)];
  };
  table["fill"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "fill");
    CheckWritable(interp, array);
    size_t length = array.elements.size();
    size_t start = ToRelativeIndex(Arg(args, 1), length, 0);
    size_t end = ToRelativeIndex(Arg(args, 2), length, length);
    for (size_t i = start; i < end; ++i) {
      array.elements[i] = Arg(args, 0);
    }
    return self;
  };

  table["forEach"] = [](Interpreter& interp, const RuntimeValue& self,
                        Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "forEach");
    ForEachElement(
        interp, self, array, Arg(args, 0), Arg(args, 1),
        [](size_t, const RuntimeValue&, const RuntimeValue&) { return true; });
    return Undefined{};
  };
  table["map"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "map");
    std::vector<RuntimeValue> out;
    out.reserve(array.elements.size());
    ForEachElement(
        interp, self, array, Arg(args, 0), Arg(args, 1),
        [&](size_t, const RuntimeValue&, const RuntimeValue& result) {
          out.push_back(result);
          return true;
        });
    return interp.NewArray(std::move(out));
  };
  table["filter"] = [](Interpreter& interp, const RuntimeValue& self,
                       Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "filter");
    std::vector<RuntimeValue> out;
    ForEachElement(
        interp, self, array, Arg(args, 0), Arg(args, 1),
        [&](size_t, const RuntimeValue& element, const RuntimeValue& result) {
          if (ToBoolean(result)) {
            out.push_back(element);
          }
          return true;
        });
    return interp.NewArray(std::move(out));
  };
  table["some"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "some");
    bool found = false;
    ForEachElement(
        interp, self, array, Arg(args, 0), Arg(args, 1),
        [&](size_t, const RuntimeValue&, const RuntimeValue& result) {
          found = ToBoolean(result);
          return !found;
        });
    return found;
  };
  table["every"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "every");
    bool all = true;
    ForEachElement(
        interp, self, array, Arg(args, 0), Arg(args, 1),
        [&](size_t, const RuntimeValue&, const RuntimeValue& result) {
          all = ToBoolean(result);
          return all;
        });
    return all;
  };
  table["find"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "find");
    RuntimeValue found = Undefined{};
    ForEachElement(
        interp, self, array, Arg(args, 0), Arg(args, 1),
        [&](size_t, const RuntimeValue& element, const RuntimeValue& result) {
          if (ToBoolean(result)) {
            found = element;
            return false;
          }
          return true;
        });
    return found;
  };
  table["findIndex"] = [](Interpreter& interp, const RuntimeValue& self,
                          Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "findIndex");
    double found = -1;
    ForEachElement(
        interp, self, array, Arg(args, 0), Arg(args, 1),
        [&](size_t i, const RuntimeValue&, const RuntimeValue& result) {
          if (ToBoolean(result)) {
            found = static_cast<double>(i);
            return false;
          }
          return true;
        });
    return found;
  };
  table["findLast"] = [](Interpreter& interp, const RuntimeValue& self,
                         Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "findLast");
    RequireCallable(interp, Arg(args, 0));
    for (size_t i = array.elements.size(); i > 0; --i) {
      if (i > array.elements.size()) {
        continue;
      }
      RuntimeValue element = array.elements[i - 1];
      std::vector<RuntimeValue> call_args = {
          element, static_cast<double>(i - 1), self};
      if (ToBoolean(interp.Call(Arg(args, 0), Arg(args, 1), call_args))) {
        return element;
      }
    }
    return Undefined{};
  };
  table["findLastIndex"] = [](Interpreter& interp, const RuntimeValue& self,
                              Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "findLastIndex");
    RequireCallable(interp, Arg(args, 0));
    for (size_t i = array.elements.size(); i > 0; --i) {
      if (i > array.elements.size()) {
        continue;
      }
      std::vector<RuntimeValue> call_args = {
          array.elements[i - 1], static_cast<double>(i - 1), self};
      if (ToBoolean(interp.Call(Arg(args, 0), Arg(args, 1), call_args))) {
        return static_cast<double>(i - 1);
      }
    }
    return -1.0;
  };

  auto reduce = [](bool from_right) {
    return [from_right](
               Interpreter& interp, const RuntimeValue& self,
               Args args) -> RuntimeValue {
      Object& array =
          ThisArray(interp, self, from_right ? "reduceRight" : "reduce");
      const RuntimeValue& callback = Arg(args, 0);
      RequireCallable(interp, callback);
      size_t length = array.elements.size();
      size_t step = 0;
      RuntimeValue accumulator;
      if (args.size() >= 2) {
        accumulator = args[1];
      } else {
        if (length == 0) {
          interp.ThrowError(
              ErrorKind::kTypeError, "Reduce of empty array with no initial value");
        }
        accumulator = array.elements[from_right ? length - 1 : 0];
        step = 1;
      }
      for (; step < length; ++step) {
        size_t i = from_right ? length - 1 - step : step;
        if (i >= array.elements.size()) {
          continue;
        }
        std::vector<RuntimeValue> call_args = {
            accumulator, array.elements[i], static_cast<double>(i), self};
        accumulator = interp.Call(callback, Undefined{}, call_args);
      }
      return accumulator;
    };
  };
  table["reduce"] = reduce(false);
  table["reduceRight"] = reduce(true);

  table["sort"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "sort");
    CheckWritable(interp, array);
    const RuntimeValue& compare = Arg(args, 0);
    if (!IsUndefined(compare)) {
      RequireCallable(interp, compare);
    }
    // The comparator may touch the array; sort a copy.
    std::vector<RuntimeValue> sorted = array.elements;
    if (IsUndefined(compare)) {
      MergeSort(sorted, DefaultCompare);
    } else {
      MergeSort(
          sorted, [&](const RuntimeValue& a, const RuntimeValue& b) {
            if (IsUndefined(a) || IsUndefined(b)) {
              return DefaultCompare(a, b);
            }
            std::vector<RuntimeValue> call_args = {a, b};
            return ToNumber(interp.Call(compare, Undefined{}, call_args)) < 0;
          });
    }
    array.elements = std::move(sorted);
    return self;
  };
  table["flat"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "flat");
    double depth = IsUndefined(Arg(args, 0)) ? 1 : ToNumber(args[0]);
    std::vector<const Object*> open{&array};
    std::vector<RuntimeValue> out;
    Flatten(interp, array.elements, std::isnan(depth) ? 0 : depth, open, out);
    return interp.NewArray(std::move(out));
  };
  table["flatMap"] = [](Interpreter& interp, const RuntimeValue& self,
                        Args args) -> RuntimeValue {
    Object& array = ThisArray(interp, self, "flatMap");
    std::vector<RuntimeValue> mapped;
    ForEachElement(
        interp, self, array, Arg(args, 0), Arg(args, 1),
        [&](size_t, const RuntimeValue&, const RuntimeValue& result) {
          mapped.push_back(result);
          return true;
        });
    std::vector<const Object*> open;
    std::vector<RuntimeValue> out;
    Flatten(interp, mapped, 1, open, out);
    return interp.NewArray(std::move(out));
  };
  table["keys"] = [](Interpreter& interp, const RuntimeValue& self, Args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "keys");
    std::vector<RuntimeValue> keys;
    for (size_t i = 0; i < array.elements.size(); ++i) {
      keys.emplace_back(static_cast<double>(i));
    }
    return interp.NewArray(std::move(keys));
  };
  table["entries"] = [](Interpreter& interp, const RuntimeValue& self, Args)
      -> RuntimeValue {
    Object& array = ThisArray(interp, self, "entries");
    std::vector<RuntimeValue> entries;
    for (size_t i = 0; i < array.elements.size(); ++i) {
      entries.emplace_back(interp.NewArray(
          {RuntimeValue(static_cast<double>(i)), array.elements[i]}));
    }
    return interp.NewArray(std::move(entries));
  };

  return table;
}

}  // namespace

auto FindArrayMethod(std::string_view name) -> const NativeFunction* {
  static const MethodTable kMethods = BuildArrayMethods();
  auto it = kMethods.find(name);
  return it == kMethods.end() ? nullptr : &it->second;
}

}  // namespace proba::script::builtins
