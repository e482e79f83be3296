#include "checker/builtin.hpp"

namespace grader {
using namespace std;

void register_builtin_checkers(checker_registry &registry) {
    registry.add(make_unique<checkers::exact_checker>());
    registry.add(make_unique<checkers::exact_ignore_exitcode_checker>());
    registry.add(make_unique<checkers::float_checker>());
    registry.add(make_unique<checkers::unordered_checker>());
    registry.add(make_unique<checkers::pastele_checker>());
    registry.add(make_unique<checkers::rez_checker>());
    registry.add(make_unique<checkers::kolekcija_checker>());
}

}  // namespace grader
