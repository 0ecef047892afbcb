#include <memory>// for allocator, __shared_ptr_access, shared_ptr
#include <string>// for string
#include <vector>

#include <fmt/format.h>

#include "ftxui/component/captured_mouse.hpp"// for ftxui
#include "ftxui/component/component.hpp"// for Input, Renderer, ResizableSplitLeft
#include "ftxui/component/component_base.hpp"// for ComponentBase, Component
#include "ftxui/component/screen_interactive.hpp"// for ScreenInteractive
#include "ftxui/dom/elements.hpp"// for operator|, separator, text, Element, flex, vbox, border

#include <lime/lime.hpp>
#include <lime/utility.hpp>


int main([[maybe_unused]] int argc, [[maybe_unused]] const char *argv[])
{
  lime::interpreter<> evaluator;

  std::string content_1;
  std::string content_2;

  // `print` writes into the output pane, there is no terminal to `get` from
  evaluator.output = [&](std::string_view text) { content_2 += fmt::format("{}\n", text); };
  evaluator.input = []() -> std::optional<std::string> { return std::nullopt; };

  std::vector<std::string> bindings;
  std::vector<std::string> entries;

  int binding_selected = 0;
  int selected = 0;

  auto update_objects = [&]() {
    bindings.clear();
    for (const auto &[name, thunk] : evaluator.global_scope) {
      bindings.push_back(lime::describe_binding(evaluator, name, thunk));
    }

    entries.clear();
    std::size_t index = 0;
    for (const auto &value : evaluator.values) {
      entries.push_back(fmt::format("{}: {}", index, lime::to_string(evaluator, true, value)));
      ++index;
    }
  };

  update_objects();

  lime::interpreter<>::size_type line_number = 1;
  auto do_evaluate = [&]() {
    content_2 += "\n> " + content_1 + "\n";

    if (const auto result = evaluator.evaluate(content_1, line_number); result) {
      if (const auto *error = evaluator.get_if<lime::interpreter<>::error_type>(&*result); error != nullptr) {
        content_2 += lime::describe(evaluator, *error);
      } else {
        content_2 += evaluator.display(*result);
      }
    }
    ++line_number;
    update_objects();
  };


  auto textarea_1 = ftxui::Input(&content_1);
  auto output_1 = ftxui::Input(&content_2);
  auto button = ftxui::Button("Evaluate", do_evaluate);
  int size = 50;
  auto resizeable_bits = ftxui::ResizableSplitLeft(textarea_1, output_1, &size);

  auto bindingbox = ftxui::Menu(&bindings, &binding_selected);
  auto valuebox = ftxui::Menu(&entries, &selected);

  auto layout = ftxui::Container::Horizontal({ bindingbox, valuebox, resizeable_bits, button });

  auto get_stats = [&]() {
    return ftxui::vbox({ ftxui::text(fmt::format("Data Sizes: interpreter<> {} Value {} Expression {} Thunk {}",
                           sizeof(lime::interpreter<>),
                           sizeof(lime::interpreter<>::Value),
                           sizeof(lime::interpreter<>::Expression),
                           sizeof(lime::interpreter<>::Thunk))),
      ftxui::text(fmt::format("strings used: {}  values used: {}  expressions used: {}  frames used: {}  thunks used: {}",
        evaluator.strings.size(),
        evaluator.values.size(),
        evaluator.expressions.size(),
        evaluator.frames.size(),
        evaluator.thunks.size())) });
  };

  auto component = ftxui::Renderer(layout, [&] {
    return ftxui::hbox({ bindingbox->Render() | ftxui::vscroll_indicator | ftxui::frame,
             ftxui::separator(),
             ftxui::vbox({ valuebox->Render() | ftxui::vscroll_indicator | ftxui::frame
                             | ftxui::size(ftxui::HEIGHT, ftxui::EQUAL, 10),
               ftxui::separator(),
               resizeable_bits->Render() | ftxui::flex,
               ftxui::separator(),
               ftxui::hbox({ button->Render(), get_stats() }) })
               | ftxui::flex })
           | ftxui::border;
  });

  auto screen = ftxui::ScreenInteractive::Fullscreen();
  screen.Loop(component);
}
