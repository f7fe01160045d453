
#include "stdinc.hpp"

#include "aggregate-views.hpp"
#include "compute-measurements.hpp"

namespace anthro
{
namespace
{
   struct Contribution
   {
      const Measurement* m = nullptr;
      const string* view_id = nullptr;
   };

   // Merges the contributions of one tier. Only the authoritative tier is
   // checked for conflicts; front-only estimates are expected to disagree.
   Measurement merge_tier(const vector<Contribution>& tier,
                          const bool authoritative,
                          const real tolerance)
   {
      Expects(!tier.empty());
      if(tier.size() == 1) return *tier.front().m;

      vector<real> values;
      values.reserve(tier.size());
      real sum_w = 0.0, sum_wv = 0.0;
      real min_conf = 1.0;
      for(const auto& c : tier) {
         values.push_back(c.m->value);
         sum_w += c.m->confidence;
         sum_wv += c.m->confidence * c.m->value;
         min_conf = std::min(min_conf, c.m->confidence);
      }

      const real mean = std::accumulate(cbegin(values), cend(values), 0.0)
                        / real(values.size());

      Measurement o;
      o.model      = tier.front().m->model;
      o.value      = (sum_w > 0.0) ? (sum_wv / sum_w) : mean;
      o.confidence = min_conf;
      o.estimated_from_front_only = tier.front().m->estimated_from_front_only;
      o.conflicting
          = authoritative
            and relative_spread(cbegin(values), cend(values)) > tolerance;
      return o;
   }
} // namespace

// ------------------------------------------------------------- aggregate-views
//
ReconciledMeasurementSet
aggregate_views(const vector<MeasurementSet>& sets,
                const AggregateParams& params,
                const Timestamp& timestamp) noexcept(false)
{
   if(sets.empty())
      throw std::runtime_error("cannot aggregate an empty list of sets");

   const auto& session = sets.front().capture_session_id;
   const auto& user    = sets.front().user_id;
   for(const auto& s : sets) {
      if(s.capture_session_id != session)
         throw std::runtime_error(format("set '{}' belongs to session '{}', "
                                         "but aggregating session '{}'",
                                         s.set_id,
                                         s.capture_session_id,
                                         session));
      if(s.user_id != user)
         throw std::runtime_error(format("set '{}' belongs to user '{}', "
                                         "but aggregating for user '{}'",
                                         s.set_id,
                                         s.user_id,
                                         user));
   }

   // field -> (authoritative, front-only)
   std::map<string, std::pair<vector<Contribution>, vector<Contribution>>>
       by_field;
   for(const auto& s : sets) {
      for(const auto& [name, m] : s.fields) {
         auto& tiers = by_field[name];
         (m.estimated_from_front_only ? tiers.second : tiers.first)
             .push_back({&m, &s.view_id});
      }
   }

   ReconciledMeasurementSet ret;
   auto& o              = ret.set;
   o.set_id             = format("{}/reconciled", session);
   o.user_id            = user;
   o.capture_session_id = session;
   o.view_id            = "reconciled"s;
   o.pose_type          = PoseType::COMBINED;
   o.created_at         = timestamp;
   o.updated_at         = timestamp;

   {
      real sum = 0.0;
      for(const auto& s : sets) sum += s.calibration_ratio;
      o.calibration_ratio = sum / real(sets.size());
   }

   for(const auto& s : sets) ret.source_set_ids.push_back(s.set_id);

   for(const auto& [name, tiers] : by_field) {
      const bool authoritative = !tiers.first.empty();
      const auto& tier         = authoritative ? tiers.first : tiers.second;
      const auto m = merge_tier(tier, authoritative, params.conflict_tolerance);

      auto& views = ret.provenance[name];
      for(const auto& c : tier) views.push_back(*c.view_id);

      if(m.conflicting) {
         ret.conflicting_fields.push_back(name);
         WARN(format("{}: session '{}', field '{}' differs by more than "
                     "{:.1f}% across views [{}]",
                     str(ErrorKind::CONFLICTING_MEASUREMENT),
                     session,
                     name,
                     100.0 * params.conflict_tolerance,
                     implode(cbegin(views), cend(views), ", ")));
      }

      o.fields[name] = m;
   }

   o.is_accurate = !ret.has_conflicts()
                   and is_accurate(o.fields, params.min_field_confidence);

   return ret;
}

} // namespace anthro
