/*
Purpose: Log skeleton conformance.

What this tests: Each of the six constraint families reports exactly the violated
pairs per case, unselected families are not evaluated, and malformed bounds are
rejected before any case is checked.
*/

#include "conformance.hpp"
#include "test_engines.hpp"

#include <cassert>
#include <set>
#include <string>

using namespace tracecheck;

namespace
{
    bool has_violation(const CaseSkeletonViolations &v, SkeletonConstraint c, const Activity &a, const Activity &b = {})
    {
        return v.count(SkeletonViolation{c, a, b}) != 0;
    }
}

int main()
{
    const ConformanceChecker checker(ConformanceConfig{});

    // Never together.
    {
        LogSkeleton sk;
        sk.neverTogether.insert({"C", "D"});
        const EventLog log = test::make_log({{"C", "X", "D"}, {"C"}});
        const auto out = checker.conformance_log_skeleton(log, sk);
        assert(out.size() == 2);
        assert(has_violation(out[0], SkeletonConstraint::NeverTogether, "C", "D"));
        assert(out[1].empty());
    }

    // Allowed occurrence counts, including absence.
    {
        LogSkeleton sk;
        sk.activOccurrences["A"] = {1, 2};
        const EventLog log = test::make_log({{"A", "A", "A"}, {"A"}, {"A", "B", "A"}, {"B"}});
        const auto out = checker.conformance_log_skeleton(log, sk);
        assert(has_violation(out[0], SkeletonConstraint::ActivOccurrences, "A"));
        assert(out[1].empty());
        assert(out[2].empty());
        assert(has_violation(out[3], SkeletonConstraint::ActivOccurrences, "A"));
    }

    // Equivalence compares counts.
    {
        LogSkeleton sk;
        sk.equivalence.insert({"A", "B"});
        const EventLog log = test::make_log({{"A", "B", "A", "B"}, {"A", "A", "B"}, {"C"}});
        const auto out = checker.conformance_log_skeleton(log, sk);
        assert(out[0].empty());
        assert(has_violation(out[1], SkeletonConstraint::Equivalence, "A", "B"));
        assert(out[2].empty());
    }

    // Always before / always after.
    {
        LogSkeleton sk;
        sk.alwaysBefore.insert({"B", "A"});
        sk.alwaysAfter.insert({"A", "C"});
        const EventLog log = test::make_log({{"A", "B", "C"}, {"B", "A"}, {"D"}});
        const auto out = checker.conformance_log_skeleton(log, sk);
        assert(out[0].empty());
        assert(has_violation(out[1], SkeletonConstraint::AlwaysBefore, "B", "A"));
        assert(has_violation(out[1], SkeletonConstraint::AlwaysAfter, "A", "C"));
        // Constraints on absent activities do not apply.
        assert(out[2].empty());
    }

    // Directly-follows bounds.
    {
        LogSkeleton sk;
        sk.directlyFollows[{"A", "B"}] = DirectlyFollowsBounds{1, 1};
        const EventLog log = test::make_log({{"A", "B"}, {"A", "C"}, {"A", "B", "A", "B"}, {"C"}});
        const auto out = checker.conformance_log_skeleton(log, sk);
        assert(out[0].empty());
        assert(has_violation(out[1], SkeletonConstraint::DirectlyFollows, "A", "B"));
        assert(has_violation(out[2], SkeletonConstraint::DirectlyFollows, "A", "B"));
        assert(out[3].empty());
    }

    // Only the selected families are evaluated.
    {
        LogSkeleton sk;
        sk.neverTogether.insert({"C", "D"});
        sk.activOccurrences["C"] = {2};
        const EventLog log = test::make_log({{"C", "D"}});
        const auto out = checker.conformance_log_skeleton(log, sk, {SkeletonConstraint::ActivOccurrences});
        assert(out[0].size() == 1);
        assert(has_violation(out[0], SkeletonConstraint::ActivOccurrences, "C"));

        const auto none = checker.conformance_log_skeleton(log, sk, std::set<SkeletonConstraint>{});
        assert(none[0].empty());
    }

    // Empty bounds.
    {
        LogSkeleton sk;
        sk.directlyFollows[{"A", "B"}] = DirectlyFollowsBounds{3, 1};
        const EventLog log = test::make_log({{"A"}});
        test::expect_throw_as<std::invalid_argument>([&]
                                                     { (void)checker.conformance_log_skeleton(log, sk); });
    }

    assert(std::string(skeleton_constraint_name(SkeletonConstraint::NeverTogether)) == "never_together");
    assert(all_skeleton_constraints().size() == 6);
    return 0;
}
