#ifndef UI_HPP
#define UI_HPP

#include <chrono>
#include <iostream>
#include <string>

namespace JsonMut {
class JsonMutator;

namespace TUI {
// boxed ftxui rendering of phase, parse rate and per-operator scores
void writeTUI(const JsonMutator &mutator, std::chrono::seconds elapsed);
// same content, plain lines
void writePlain(std::ostream &out, const JsonMutator &mutator,
                std::chrono::seconds elapsed);
std::string formatUptime(std::chrono::seconds elapsed);
} // namespace TUI
} // namespace JsonMut
#endif // UI_HPP
