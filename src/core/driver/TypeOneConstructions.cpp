#include "TypeOneConstructions.h"
#include "../geometry/Figure.h"

#include <QLoggingCategory>

#include <deque>
#include <set>

Q_DECLARE_LOGGING_CATEGORY(logDriver)

namespace geodeduce::core::driver {

namespace {

int sign(int value) {
    return (value > 0) - (value < 0);
}

} // namespace

std::size_t enumerateSubAndSuperTriangles(geometry::Figure& figure) {
    const auto existing = figure.entities(EntityType::Triangle);
    std::deque<EntityID> work(existing.begin(), existing.end());
    std::set<EntityID> visited;
    std::size_t constructed = 0;

    while (!work.empty()) {
        const EntityID triangle = figure.resolve(work.front());
        work.pop_front();
        if (!visited.insert(triangle).second) {
            continue;
        }
        const auto vertices = figure.getEntityAs<geometry::Triangle>(triangle)->points();

        for (std::size_t r = 0; r < 3; ++r) {
            const EntityID a = vertices[r];
            const EntityID b = vertices[(r + 1) % 3];
            const EntityID c = vertices[(r + 2) % 3];
            const EntityID base = figure.findLine(b, c);
            if (base == kInvalidEntityID) {
                continue;
            }
            const auto onLine = figure.getEntityAs<geometry::Line>(base)->points();

            for (EntityID x : onLine) {
                if (x == b || x == c || figure.findSegment(a, x) == kInvalidEntityID) {
                    continue;
                }
                // Constructing a triangle may merge or extend the line
                const auto* line = figure.getEntityAs<geometry::Line>(figure.resolve(base));
                const int ib = line->indexOf(b);
                const int ic = line->indexOf(c);
                const int ix = line->indexOf(x);
                const std::vector<EntityID> withoutC = sign(ix - ib) == sign(ic - ib)
                                                           ? std::vector<EntityID>{a, b, x}
                                                           : std::vector<EntityID>{a, x, b};
                const std::vector<EntityID> withoutB = sign(ix - ic) == sign(ib - ic)
                                                           ? std::vector<EntityID>{a, x, c}
                                                           : std::vector<EntityID>{a, c, x};
                for (const auto& candidate : {withoutC, withoutB}) {
                    if (figure.findPolygon(candidate) != kInvalidEntityID) {
                        continue;
                    }
                    work.push_back(figure.triangle(candidate));
                    ++constructed;
                }
            }
        }
    }
    qCDebug(logDriver) << "Type-one constructions added" << constructed << "triangles";
    return constructed;
}

} // namespace geodeduce::core::driver
