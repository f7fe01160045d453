
#include "stdinc.hpp"

#include "keypoint-frame.hpp"

#include "anthro/io/json-io.hpp"

namespace anthro
{
// ------------------------------------------------------------------- pose-type
//
const char* str(const PoseType x) noexcept
{
   switch(x) {
   case PoseType::FRONT: return "front";
   case PoseType::SIDE: return "side";
   case PoseType::COMBINED: return "combined";
   }
   return "<unknown>";
}

PoseType to_pose_type(const string_view val) noexcept(false)
{
#define E(x, s) \
   if(val == s) return PoseType::x;
   E(FRONT, "front");
   E(SIDE, "side");
   E(COMBINED, "combined");
#undef E
   throw std::runtime_error(format("could not convert '{}' to a pose type", val));
}

// -------------------------------------------------------------------- Keypoint
//
bool Keypoint::operator==(const Keypoint& o) const noexcept
{
   auto eq = [](real a, real b) {
      return (std::isnan(a) and std::isnan(b)) or a == b;
   };
   return eq(x, o.x) and eq(y, o.y) and eq(z, o.z)
          and eq(confidence, o.confidence);
}

Json::Value Keypoint::to_json() const noexcept
{
   auto o          = Json::Value{Json::objectValue};
   o["x"]          = json_save(x);
   o["y"]          = json_save(y);
   o["z"]          = json_save(z);
   o["confidence"] = json_save(confidence);
   return o;
}

void Keypoint::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading keypoint"s;
   Keypoint kp;
   kp.x          = json_load_key<real>(o, "x", op);
   kp.y          = json_load_key<real>(o, "y", op);
   kp.confidence = json_load_key<real>(o, "confidence", op);
   if(has_key(o, "z")) kp.z = json_load_key<real>(o, "z", op);
   *this = kp;
}

string Keypoint::to_string() const noexcept
{
   return is_3d() ? format("[{}, {}, {}] @ {}", x, y, z, confidence)
                  : format("[{}, {}] @ {}", x, y, confidence);
}

// ---------------------------------------------------------------- construction
//
KeypointFrame::KeypointFrame(string frame_id,
                             PoseType pose_type,
                             unsigned width,
                             unsigned height,
                             joint_map_type joints)
    : frame_id_(std::move(frame_id))
    , pose_type_(pose_type)
    , width_(width)
    , height_(height)
    , joints_(std::move(joints))
{}

KeypointFrame
KeypointFrame::from_indexed(string frame_id,
                            PoseType pose_type,
                            unsigned width,
                            unsigned height,
                            const vector<Keypoint>& detections) noexcept(false)
{
   if(detections.size() > size_t(k_n_keypoints))
      throw std::runtime_error(format("expected at most {} detections, got {}",
                                      k_n_keypoints,
                                      detections.size()));
   joint_map_type joints;
   for(size_t i = 0; i < detections.size(); ++i) {
      const auto& kp = detections[i];
      if(kp.confidence > 0.0)
         joints[joint_name(int_to_keypoint_name(int(i)))] = kp;
   }
   return KeypointFrame(
       std::move(frame_id), pose_type, width, height, std::move(joints));
}

// ------------------------------------------------------------------ operator==
//
bool KeypointFrame::operator==(const KeypointFrame& o) const noexcept
{
   return frame_id_ == o.frame_id_ and pose_type_ == o.pose_type_
          and width_ == o.width_ and height_ == o.height_
          and joints_ == o.joints_;
}

// ------------------------------------------------------------------------ find
//
const Keypoint* KeypointFrame::find(const string_view joint) const noexcept
{
   auto ii = joints_.find(joint);
   return (ii == cend(joints_)) ? nullptr : &ii->second;
}

KeypointFrame KeypointFrame::without_joint(const string_view joint) const
    noexcept
{
   KeypointFrame o = *this;
   auto ii         = o.joints_.find(joint);
   if(ii != end(o.joints_)) o.joints_.erase(ii);
   return o;
}

// --------------------------------------------------------------------- to-json
//
Json::Value KeypointFrame::to_json() const noexcept
{
   auto o         = Json::Value{Json::objectValue};
   o["frame_id"]  = frame_id_;
   o["pose_type"] = str(pose_type_);
   o["width"]     = width_;
   o["height"]    = height_;

   auto j = Json::Value{Json::objectValue};
   for(const auto& [name, kp] : joints_) j[name] = kp.to_json();
   o["joints"] = j;
   return o;
}

string KeypointFrame::to_string() const noexcept
{
   return format("KeypointFrame '{}' ({}, {}x{}, {} joints)",
                 frame_id_,
                 str(pose_type_),
                 width_,
                 height_,
                 joints_.size());
}

// ------------------------------------------------------------------------ read
//
// Joints are either named:
//
//    "joints": { "nose": {"x": 1.0, "y": 2.0, "confidence": 0.9}, ... }
//
// or a flat, BODY_25-indexed detector array:
//
//    "pose_keypoints_2d": [x0, y0, c0, x1, y1, c1, ...]
//
void read(KeypointFrame& frame, const Json::Value& node) noexcept(false)
{
   const string op = "reading keypoint frame"s;

   const auto frame_id = json_load_key<string>(node, "frame_id", op);
   const auto pose     = to_pose_type(json_load_key<string>(node, "pose_type", op));
   const auto width    = json_load_key<unsigned>(node, "width", op);
   const auto height   = json_load_key<unsigned>(node, "height", op);

   if(has_key(node, "pose_keypoints_2d")) {
      vector<real> flat;
      json_load(get_key(node, "pose_keypoints_2d"), flat);
      if(flat.size() % 3 != 0)
         throw std::runtime_error(format("'pose_keypoints_2d' of frame '{}' "
                                         "must hold triples, but has {} values",
                                         frame_id,
                                         flat.size()));
      vector<Keypoint> dets(flat.size() / 3);
      for(size_t i = 0; i < dets.size(); ++i)
         dets[i] = Keypoint(flat[3 * i + 0], flat[3 * i + 1], flat[3 * i + 2]);
      frame = KeypointFrame::from_indexed(frame_id, pose, width, height, dets);
      return;
   }

   const auto j = get_key(node, "joints");
   if(!j.isObject())
      throw std::runtime_error(
          format("'joints' of frame '{}' must be an object", frame_id));

   KeypointFrame::joint_map_type joints;
   for(const auto& name : j.getMemberNames()) {
      try {
         joints[name].read(j[name]);
      } catch(std::runtime_error& e) {
         throw std::runtime_error(format(
             "error reading joint '{}' of frame '{}': {}", name, frame_id, e.what()));
      }
   }

   frame = KeypointFrame(frame_id, pose, width, height, std::move(joints));
}

} // namespace anthro
