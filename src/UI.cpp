#include "UI.hpp"
#include "JsonMutator.hpp"
#include <algorithm>
#include <format>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>
#include <iomanip>
#include <sstream>

using namespace ftxui;
using namespace JsonMut;

std::string JsonMut::TUI::formatUptime(std::chrono::seconds elapsed) {
    auto secs_total = elapsed.count();
    int hours = static_cast<int>(secs_total / 3600);
    int minutes = static_cast<int>((secs_total % 3600) / 60);
    int seconds = static_cast<int>(secs_total % 60);

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ":" << std::setw(2)
        << minutes << ":" << std::setw(2) << seconds;
    return oss.str(); // "hh:mm:ss"
}

static std::string phaseLabel(const CurriculumState &curriculum) {
    auto last = curriculum.lastPhase();
    return last ? phaseName(*last) : "-";
}

void JsonMut::TUI::writeTUI(const JsonMutator &mutator,
                            std::chrono::seconds elapsed) {
    const auto &curriculum = mutator.curriculum();
    const auto &scheduler = mutator.scheduler();
    const auto &picks = mutator.pickCounts();
    const auto trials = std::max<uint64_t>(mutator.trials(), 1);

    Element time_box = vbox({
                           filler(),
                           text("[Uptime]"),
                           text(formatUptime(elapsed)),
                           filler(),
                       }) |
                       size(WIDTH, EQUAL, 12) | flex | border;

    Element stats =
        vbox({
            filler(),
            hbox({text("Phase: ") | dim, text(phaseLabel(curriculum)),
                  separator(), text("ParseRate: ") | dim,
                  text(std::format("{:.3f}", curriculum.rate())), separator(),
                  text("ParseOK: ") | dim,
                  text(std::to_string(curriculum.parseOk)), separator(),
                  text("Trials: ") | dim,
                  text(std::to_string(mutator.trials()))}),
            hbox({text("Plateau: ") | dim,
                  text(curriculum.plateau().enabled()
                           ? curriculum.plateau().path()
                           : "off"),
                  separator(), text("Placeholders: ") | dim,
                  text(std::to_string(mutator.placeholders()))}),
            filler(),
        }) |
        flex;

    Elements rows;
    rows.push_back(hbox({text("#") | size(WIDTH, EQUAL, 4) | bold,
                         text("operator") | size(WIDTH, EQUAL, 18) | bold,
                         text("phase") | size(WIDTH, EQUAL, 7) | bold,
                         text("score") | size(WIDTH, EQUAL, 10) | bold,
                         text("picks") | size(WIDTH, EQUAL, 10) | bold,
                         text("share") | bold}));
    rows.push_back(separator());
    const auto registry = mutator.registry();
    for (size_t i = 0; i < registry.size(); ++i) {
        const float share =
            static_cast<float>(picks[i]) / static_cast<float>(trials);
        rows.push_back(hbox({
            text(std::to_string(i)) | size(WIDTH, EQUAL, 4),
            text(std::string(registry[i].name)) | size(WIDTH, EQUAL, 18),
            text(phaseName(phaseOf(i))) | size(WIDTH, EQUAL, 7),
            text(std::format("{:.4f}", scheduler.score(i))) |
                size(WIDTH, EQUAL, 10),
            text(std::to_string(picks[i])) | size(WIDTH, EQUAL, 10),
            gauge(share) | flex,
        }));
    }
    Element ops_box =
        vbox({text("[Operators]") | bold, vbox(std::move(rows))}) | border;

    Element ui =
        vbox({hbox({stats | flex, time_box | align_right}), separator(),
              ops_box});

    auto screen = Screen::Create(Dimension::Full(), Dimension::Fit(ui));
    Render(screen, ui);
    screen.Print();
    std::cout << std::endl;
}

void JsonMut::TUI::writePlain(std::ostream &out, const JsonMutator &mutator,
                              std::chrono::seconds elapsed) {
    const auto &curriculum = mutator.curriculum();
    const auto &scheduler = mutator.scheduler();
    const auto registry = mutator.registry();
    out << std::format("uptime {}  phase {}  parse rate {:.3f} ({}/{})  "
                       "trials {}  placeholders {}\n",
                       formatUptime(elapsed), phaseLabel(curriculum),
                       curriculum.rate(), curriculum.parseOk,
                       curriculum.parseAll, mutator.trials(),
                       mutator.placeholders());
    for (size_t i = 0; i < registry.size(); ++i) {
        out << std::format("  {:>2} {:<18} {} score {:>8.4f} picks {}\n", i,
                           registry[i].name, phaseName(phaseOf(i)),
                           scheduler.score(i), mutator.pickCounts()[i]);
    }
}
