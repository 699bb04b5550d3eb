#pragma once

class CTerminal;
class COnboard;

namespace OnboardUi {
    void draw(CTerminal& term, const COnboard& onboard);
}
