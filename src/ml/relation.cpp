#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <sstream>

#include "../core/errors.hpp"
#include "relation.hpp"

namespace wl {
    namespace ml {

        using core::Abstain;

        namespace {
            const std::string Person = "person";

            bool OneOf(const std::string & category,
                       std::initializer_list<const char *> set) {
                return std::any_of(set.begin(), set.end(),
                                   [&category](const char * c) { return category == c; });
            }

            std::vector<std::string> SplitTabs(const std::string & line) {
                std::vector<std::string> fields;
                std::istringstream ss(line);
                std::string field;
                while (std::getline(ss, field, '\t')) {
                    fields.push_back(field);
                }
                return fields;
            }

            template <class T>
            T ParseField(const std::string & field, int lineno,
                         T (*parse)(const std::string &, size_t *)) {
                size_t consumed = 0;
                T v = T();
                try {
                    v = parse(field, &consumed);
                } catch (const std::logic_error &) {
                    consumed = 0;
                }
                if (field.empty() || consumed != field.size()) {
                    throw core::InvalidInput("relations", "line " + std::to_string(lineno) +
                                                              ": \"" + field +
                                                              "\" is not a number");
                }
                return v;
            }

            int ParseInt(const std::string & s, size_t * consumed) {
                return std::stoi(s, consumed);
            }
            double ParseDouble(const std::string & s, size_t * consumed) {
                return std::stod(s, consumed);
            }

            BoundingBox ParseBox(const std::vector<std::string> & fields, int start,
                                 int lineno) {
                return BoundingBox{ParseField(fields[start], lineno, ParseDouble),
                                   ParseField(fields[start + 1], lineno, ParseDouble),
                                   ParseField(fields[start + 2], lineno, ParseDouble),
                                   ParseField(fields[start + 3], lineno, ParseDouble)};
            }
        }

        std::vector<RelationExample> LoadRelationExamples(std::istream & in) {
            std::vector<RelationExample> examples;
            std::string line;
            int lineno = 0;
            while (std::getline(in, line)) {
                lineno++;
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                if (line.empty() || line[0] == '#')
                    continue;
                auto fields = SplitTabs(line);
                if (fields.size() != 12) {
                    throw core::InvalidInput("relations",
                                             "line " + std::to_string(lineno) + " has " +
                                                 std::to_string(fields.size()) +
                                                 " fields, 12 expected");
                }
                RelationExample x;
                x.label = ParseField(fields[0], lineno, ParseInt);
                if (x.label < Abstain || x.label >= RelationCardinality) {
                    throw core::InvalidInput("relations", "line " + std::to_string(lineno) +
                                                              ": label out of range");
                }
                x.subject_bbox = ParseBox(fields, 1, lineno);
                x.subject_category = fields[5];
                x.object_bbox = ParseBox(fields, 6, lineno);
                x.object_category = fields[10];
                x.source_img = fields[11];
                examples.push_back(std::move(x));
            }
            return examples;
        }

        std::vector<RelationExample> LoadRelationExamples(const std::string & filename) {
            std::ifstream in(filename);
            if (!in.is_open()) {
                throw core::InvalidInput("filename",
                                         "\"" + filename + "\" cannot be opened");
            }
            return LoadRelationExamples(in);
        }

        core::LabelVector GoldLabels(const std::vector<RelationExample> & examples) {
            core::LabelVector Y(examples.size());
            for (int i = 0; i < examples.size(); i++) {
                Y[i] = examples[i].label;
            }
            return Y;
        }

        int LFRideObject(const RelationExample & x) {
            if (x.subject_category == Person &&
                OneOf(x.object_category, {"bike", "snowboard", "motorcycle", "horse"}))
                return Ride;
            return Abstain;
        }

        int LFCarryObject(const RelationExample & x) {
            if (x.subject_category == Person &&
                OneOf(x.object_category, {"bag", "surfboard", "skis"}))
                return Carry;
            return Abstain;
        }

        int LFCarrySubject(const RelationExample & x) {
            if (x.object_category == Person &&
                OneOf(x.subject_category,
                      {"chair", "bike", "snowboard", "motorcycle", "horse"}))
                return Carry;
            return Abstain;
        }

        int LFNotPerson(const RelationExample & x) {
            return x.subject_category != Person ? Other : Abstain;
        }

        int LFYDist(const RelationExample & x) {
            return x.subject_bbox.xmax < x.object_bbox.xmax ? Other : Abstain;
        }

        int LFDist(const RelationExample & x) {
            double dy1 = x.subject_bbox.ymin - x.object_bbox.ymin;
            double dy2 = x.subject_bbox.ymax - x.object_bbox.ymax;
            double dx1 = x.subject_bbox.xmin - x.object_bbox.xmin;
            double dx2 = x.subject_bbox.xmax - x.object_bbox.xmax;
            double dist = std::sqrt(dy1 * dy1 + dy2 * dy2 + dx1 * dx1 + dx2 * dx2);
            return dist <= 1000 ? Other : Abstain;
        }

        int LFArea(const RelationExample & x) {
            double object_area = x.object_bbox.area();
            if (object_area <= 0)
                return Abstain;
            return x.subject_bbox.area() / object_area <= 0.5 ? Other : Abstain;
        }

        std::vector<NamedLabelingFunction<RelationExample>>
        RelationLabelingFunctions() {
            return {{"ride_object", LFRideObject},   {"carry_object", LFCarryObject},
                    {"carry_subject", LFCarrySubject}, {"not_person", LFNotPerson},
                    {"ydist", LFYDist},               {"dist", LFDist},
                    {"area", LFArea}};
        }
    }
}
