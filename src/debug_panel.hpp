#pragma once
#include <cstdio>
#include <functional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel — provider registry for the F3 overlay.
//
// Stored as a World resource. Modules call watch(section, label, fn) while
// installing; DebugSystem evaluates every provider each rendered frame while
// the panel is visible. Sections keep their first-registration order.
//
// No engine dependencies, so the core library and tests can fill it.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
    };

    bool visible = false;

    void watch(const std::string& section, const std::string& label, Provider fn) {
        if (Section* s = find(section)) {
            s->rows.push_back({label, std::move(fn)});
            return;
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    const std::vector<Section>& sections() const { return sections_; }

    Section* find(const std::string& title) {
        for (auto& s : sections_) {
            if (s.title == title) return &s;
        }
        return nullptr;
    }

    std::size_t row_count() const {
        std::size_t n = 0;
        for (const auto& s : sections_) n += s.rows.size();
        return n;
    }

    // "%.<precision>f" followed by an optional unit suffix.
    static std::string fixed(float value, int precision, const char* unit = "") {
        char b[32];
        std::snprintf(b, sizeof(b), "%.*f%s", precision, static_cast<double>(value), unit);
        return b;
    }

private:
    std::vector<Section> sections_;
};
