#include "categorize/Category.hpp"

namespace categorize {

const char* to_string(Category c) {
    switch (c) {
        case Category::Fitness: return "fitness";
        case Category::Education: return "education";
        case Category::Mindfulness: return "mindfulness";
        case Category::Work: return "work";
        case Category::Health: return "health";
        case Category::Social: return "social";
        case Category::Finance: return "finance";
        case Category::Other: return "other";
        default: return "other";
    }
}

std::optional<Category> category_from_string(const std::string& id) {
    for (Category c : all_categories()) {
        if (id == to_string(c)) return c;
    }
    return std::nullopt;
}

const std::vector<Category>& all_categories() {
    static const std::vector<Category> cats = {
        Category::Fitness,
        Category::Education,
        Category::Mindfulness,
        Category::Work,
        Category::Health,
        Category::Social,
        Category::Finance,
        Category::Other
    };
    return cats;
}

}  // namespace categorize
