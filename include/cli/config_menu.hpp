#ifndef CONFIG_MENU_HPP
#define CONFIG_MENU_HPP

#include "session/session_config.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

// Preset -> (custom: model, audio, advanced) -> summary -> start / reconfigure / cancel
class ConfigMenu {
public:
    ConfigMenu(std::istream& in, std::ostream& out);

    // Fills config and returns true on "start"; false on cancel or end of input.
    // Reconfigure starts over from the config passed in.
    bool run(SessionConfig& config);

private:
    enum class Step {
        Preset,
        ModelVariant,
        AudioProcessing,
        Advanced,
        Confirm,
        Start,
        Cancel
    };

    std::istream& in_;
    std::ostream& out_;

    Step preset(SessionConfig& config);
    Step modelVariant(SessionConfig& config);
    Step audioProcessing(SessionConfig& config);
    Step advanced(SessionConfig& config);
    Step confirm(const SessionConfig& config);

    // Index of the picked option, `current` on empty input, -1 at end of input
    int choose(const std::string& title, const std::vector<std::string>& options, int current);

    void welcome();
};

#endif
