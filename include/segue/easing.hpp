#ifndef SEGUE_EASING_HPP_INCLUDED
#define SEGUE_EASING_HPP_INCLUDED

#include <functional>

namespace segue {
    using easing_function = std::function<float(float)>;
}

// Penner's curves as ported by tween.js. Each maps progress k in [0, 1] to an eased fraction;
// elastic and back leave [0, 1] on the way.
namespace segue::easing {
    namespace linear {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }

    namespace quadratic {
        float in(float k);
        float out(float k);
        float in_out(float k);
        // bezier(k, 0) behaves like in(k), bezier(k, 1) like out(k)
        float bezier(float k, float c);
    }

    namespace cubic {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }

    namespace quartic {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }

    namespace quintic {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }

    namespace sinusoidal {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }

    namespace exponential {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }

    namespace circular {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }

    namespace elastic {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }

    namespace back {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }

    namespace bounce {
        float in(float k);
        float out(float k);
        float in_out(float k);
    }
}

#endif
