#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "labeling_function.hpp"

namespace wl {
    namespace ml {

        // classes of the subject-object visual relation task
        enum RelationLabel : int { Ride = 0, Carry = 1, Other = 2 };
        constexpr int RelationCardinality = 3;

        struct BoundingBox {
            double ymin, ymax, xmin, xmax;
            double area() const { return (ymax - ymin) * (xmax - xmin); }
        };

        struct RelationExample {
            int label = core::Abstain;
            BoundingBox subject_bbox;
            std::string subject_category;
            BoundingBox object_bbox;
            std::string object_category;
            std::string source_img;
        };

        // tab separated: label, subject ymin ymax xmin xmax, subject category,
        // object ymin ymax xmin xmax, object category, source image
        std::vector<RelationExample> LoadRelationExamples(std::istream & in);
        std::vector<RelationExample> LoadRelationExamples(const std::string & filename);

        core::LabelVector GoldLabels(const std::vector<RelationExample> & examples);

        // category, distance and size heuristics voting Ride, Carry or Other
        std::vector<NamedLabelingFunction<RelationExample>> RelationLabelingFunctions();

        int LFRideObject(const RelationExample & x);
        int LFCarryObject(const RelationExample & x);
        int LFCarrySubject(const RelationExample & x);
        int LFNotPerson(const RelationExample & x);
        int LFYDist(const RelationExample & x);
        int LFDist(const RelationExample & x);
        int LFArea(const RelationExample & x);
    }
}
