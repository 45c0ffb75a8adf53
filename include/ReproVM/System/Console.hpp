#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace ReproVM {

// Operator-facing tables and banners on stdout; diagnostics go through BoostLogger.
class Console {
public:
    enum class Tone { Plain, Good, Warn, Bad, Dim, Accent };

    Console(std::ostream& out, bool colour);

    void rule();
    void heading(std::string_view title);
    void line(std::string_view text = {});
    void field(std::string_view label, std::string_view value, Tone tone = Tone::Plain);

    [[nodiscard]] std::string paint(std::string_view text, Tone tone) const;
    [[nodiscard]] std::string bold(std::string_view text) const;

private:
    std::ostream& out_;
    bool colour_;
};

} // namespace ReproVM
