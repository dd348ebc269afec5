#include "Prompter.h"
#include "Types.h"

#include <iostream>
#include <print>
#include <string>

int main() {
  try {
    auto &prompter = ask::console();

    auto name = prompter.request<std::string>("Your name: ");
    auto [age, height] = prompter.requestAll(
        ask::Request<int>{"Your age: "},
        ask::Request<double>{
            "Your height in metres: ", [](const ask::ParseFailure &failure) {
              std::print(std::cerr, "{}: give it like 1.75\n", failure.reason);
            }});

    bool again{};
    prompter.read(again, "Once more (true/false)? ");

    std::print("{}, {} years, {} m{}\n", name, age, height,
               again ? ", see you again" : "");
  } catch (const ask::StreamException &ex) {
    std::print(std::cerr, "\n[input] {}\n", ex.what());
    return 1;
  } catch (const ask::ConfigException &ex) {
    std::print(std::cerr, "[config] {}\n", ex.what());
    return 2;
  }
}
