#ifndef LIME_UTILITY_HPP
#define LIME_UTILITY_HPP

#include "lime.hpp"

#include <fmt/format.h>

namespace lime {
template<typename> inline constexpr bool is_interpreter_v = false;

template<std::unsigned_integral SizeType, std::floating_point FloatType>
inline constexpr bool is_interpreter_v<lime::interpreter<SizeType, FloatType>> = true;

template<typename T>
concept Interpreter = is_interpreter_v<T>;


template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::Value &input);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::number_type input);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::Closure &);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::Builtin &);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const std::monostate &);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::list_type &list);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::string_type &string);
template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::error_type &error);


template<Interpreter Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::number_type input)
{
  std::string result;
  if (annotate) { result = "[number] "; }

  return result + format_number(input);
}

template<Interpreter Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::Closure &closure)
{
  if (!annotate) { return "[function]"; }

  const auto frame = closure.frame == Eval::global_frame ? std::string{ "global" } : fmt::format("{}", closure.frame);
  if (closure.parameter.empty()) { return fmt::format("[closure \\. body {} frame {}]", closure.body, frame); }
  return fmt::format(
    "[closure \\{}. body {} frame {}]", engine.view(closure.parameter), closure.body, frame);
}

template<Interpreter Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::Builtin &builtin)
{
  if (!annotate) { return "[function]"; }
  return fmt::format("[builtin {} {}/{}]", engine.view(builtin.name), builtin.applied, builtin.arity);
}

template<Interpreter Eval> std::string to_string([[maybe_unused]] const Eval &, bool annotate, const std::monostate &)
{
  if (annotate) { return "[none] ()"; }
  return "()";
}

template<Interpreter Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::list_type &list)
{
  std::string result;

  if (annotate) { result += fmt::format("[list] {{{}, {}}} ", list.start, list.size); }
  result += "[";

  const auto span = engine.items(list);
  if (!span.empty()) {
    for (const auto &item : span.subspan(0, span.size() - 1)) { result += to_string(engine, false, item) + ", "; }
    result += to_string(engine, false, span.back());
  }
  result += "]";
  return result;
}

template<Interpreter Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::string_type &string)
{
  if (annotate) {
    return fmt::format("[string] {{{}, {}}} \"{}\"", string.start, string.size, engine.view(string));
  } else {
    return std::string{ engine.view(string) };
  }
}

template<Interpreter Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::error_type &error)
{
  std::string result;
  if (annotate) { result = "[error] "; }
  return result + fmt::format("{} error: {}", kind_name(error.kind), engine.view(error.message));
}

template<Interpreter Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::Value &input)
{
  return std::visit([&](const auto &value) { return to_string(engine, annotate, value); }, input.value);
}

// "type error: expected type of number; received type of string at (ln: 1, col: 1)"
template<Interpreter Eval> std::string describe(const Eval &engine, const typename Eval::error_type &error)
{
  if (error.line == 0) { return to_string(engine, false, error); }
  return fmt::format("{} at (ln: {}, col: {})", to_string(engine, false, error), error.line, error.column);
}

template<Interpreter Eval> std::string_view thunk_state_name(typename Eval::thunk_state state)
{
  switch (state) {
  case Eval::thunk_state::unforced:
    return "unforced";
  case Eval::thunk_state::forcing:
    return "forcing";
  case Eval::thunk_state::forced:
    return "forced";
  }
  return "unknown";
}

// "fact: [closure \n. body 12 frame global]" or "x: [thunk] unforced"
template<Interpreter Eval>
std::string describe_binding(const Eval &engine, const typename Eval::string_type &name, typename Eval::size_type thunk)
{
  const auto &cell = engine.thunks[thunk];
  if (cell.state == Eval::thunk_state::forced) {
    return fmt::format("{}: {}", engine.view(name), to_string(engine, true, cell.value));
  }
  return fmt::format("{}: [thunk] {}", engine.view(name), thunk_state_name<Eval>(cell.state));
}
}// namespace lime

#endif
