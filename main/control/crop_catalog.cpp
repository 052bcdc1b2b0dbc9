#include <main/control/crop_catalog.hpp>
#include <main/control/interpolation.hpp>
#include <cctype>
#include <cstring>

namespace {
    constexpr ControlPoint kOnionKc[] = {
        {0, 0.7}, {15, 0.7}, {21, 0.8}, {24, 0.9}, {29, 0.94}, {33, 1.0}, {82, 1.1}, {106, 0.8}
    };
    constexpr ControlPoint kOnionRootM[] = {
        {0, 0.05}, {18, 0.25}, {38, 0.43}, {73, 0.60}, {106, 0.60}
    };
    constexpr ControlPoint kMaizeKc[] = {
        {0, 0.3}, {20, 0.3}, {40, 0.7}, {60, 1.0}, {80, 0.8}, {100, 0.6}
    };
    constexpr ControlPoint kMaizeRootM[] = {
        {0, 0.30}, {20, 0.50}, {40, 0.80}, {60, 1.20}, {80, 1.50}
    };

    template<std::size_t N>
    constexpr std::size_t countOf(const ControlPoint (&)[N]) {
        return N;
    }

    static_assert(Interpolation::isStrictlyIncreasing(kOnionKc, countOf(kOnionKc)), "onion Kc table not sorted");
    static_assert(Interpolation::isStrictlyIncreasing(kOnionRootM, countOf(kOnionRootM)), "onion root table not sorted");
    static_assert(Interpolation::isStrictlyIncreasing(kMaizeKc, countOf(kMaizeKc)), "maize Kc table not sorted");
    static_assert(Interpolation::isStrictlyIncreasing(kMaizeRootM, countOf(kMaizeRootM)), "maize root table not sorted");

    const CropProfile kProfiles[] = {
        { CropId::ONION, "onion", kOnionKc, countOf(kOnionKc), kOnionRootM, countOf(kOnionRootM) },
        { CropId::MAIZE, "maize", kMaizeKc, countOf(kMaizeKc), kMaizeRootM, countOf(kMaizeRootM) },
    };

    bool equalsIgnoreCase(const char* a, std::size_t a_len, const char* b) {
        if (std::strlen(b) != a_len) {
            return false;
        }
        for (std::size_t i = 0; i < a_len; ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }
}

namespace CropCatalog {
    const CropProfile& profile(CropId id) {
        for (const CropProfile& p : kProfiles) {
            if (p.id == id) {
                return p;
            }
        }
        return kProfiles[0];
    }

    const CropProfile* findByName(const char* name) {
        if (name == nullptr) {
            return nullptr;
        }
        while (*name != '\0' && std::isspace(static_cast<unsigned char>(*name))) {
            ++name;
        }
        std::size_t len = std::strlen(name);
        while (len > 0 && std::isspace(static_cast<unsigned char>(name[len - 1]))) {
            --len;
        }
        for (const CropProfile& p : kProfiles) {
            if (equalsIgnoreCase(name, len, p.name)) {
                return &p;
            }
        }
        return nullptr;
    }

    const char* name(CropId id) {
        return profile(id).name;
    }

    double kcForDay(CropId id, int day) {
        const CropProfile& p = profile(id);
        return Interpolation::interpolate(day, p.kc, p.kc_count);
    }

    double rootZoneMmForDay(CropId id, int day) {
        const CropProfile& p = profile(id);
        return Interpolation::interpolate(day, p.root_depth_m, p.root_depth_count) * 1000.0;
    }
}
