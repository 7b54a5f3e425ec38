#include "sc/serialization/Serialization.hpp"
#include "sc/core/Log.hpp"
#include "sc/registry/ComponentRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace sc {

namespace {

constexpr int kFormatVersion = 1;

bool restoreFlags(ComponentRegistry& reg, const ComponentRecord& rec) {
  OpResult r = reg.setZOrder(rec.id, rec.zOrder);
  // A zero size means the record carried none; keep the probed one.
  bool hasSize = rec.size.width > 0.0 || rec.size.height > 0.0;
  if (r.ok && hasSize && rec.size != reg.get(rec.id)->size) r = reg.resize(rec.id, rec.size);
  if (r.ok && rec.locked) r = reg.lock(rec.id);
  if (r.ok && !rec.visible) r = reg.hide(rec.id);
  if (r.ok) r = reg.setPayload(rec.id, rec.payload);
  if (!r.ok) {
    logMessage("Serialization", "record '%s': %s", rec.id.c_str(), r.err.message.c_str());
    return false;
  }
  return true;
}

double numberOr(const rapidjson::Value& obj, const char* key, double fallback) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsNumber()) return fallback;
  return it->value.GetDouble();
}

bool boolOr(const rapidjson::Value& obj, const char* key, bool fallback) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsBool()) return fallback;
  return it->value.GetBool();
}

std::string stringOr(const rapidjson::Value& obj, const char* key, const std::string& fallback) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsString()) return fallback;
  return std::string(it->value.GetString(), it->value.GetStringLength());
}

} // namespace

std::vector<ComponentRecord> serialize(const ComponentRegistry& reg) {
  std::vector<ComponentRecord> out;
  for (const auto& c : reg.getAll()) {
    ComponentRecord rec;
    rec.id = c.id;
    rec.kind = c.kind;
    rec.position = c.position;
    rec.size = c.size;
    rec.zOrder = c.zOrder;
    rec.locked = c.locked;
    rec.visible = c.visible;
    rec.payload = c.payload;
    out.push_back(std::move(rec));
  }
  return out;
}

std::size_t deserialize(ComponentRegistry& reg, std::vector<ComponentRecord> records,
                        const HandleFactory& factory) {
  reg.clear();

  std::stable_sort(records.begin(), records.end(),
                   [](const ComponentRecord& a, const ComponentRecord& b) {
                     return a.zOrder < b.zOrder;
                   });

  if (!factory) {
    logMessage("Serialization", "no handle factory; %zu records skipped", records.size());
    return 0;
  }

  std::size_t restored = 0;
  for (const auto& rec : records) {
    if (rec.id.empty()) {
      logMessage("Serialization", "skipping record with empty id");
      continue;
    }
    if (reg.contains(rec.id)) {
      logMessage("Serialization", "skipping duplicate record '%s'", rec.id.c_str());
      continue;
    }

    HandleId handle = factory(rec);
    if (handle == kInvalidHandle) {
      logMessage("Serialization", "factory returned no handle for '%s' (kind %s); skipped",
                 rec.id.c_str(), rec.kind.c_str());
      continue;
    }

    OpResult r = reg.add(rec.id, handle, rec.position, rec.kind);
    if (!r.ok) {
      logMessage("Serialization", "record '%s': %s", rec.id.c_str(), r.err.message.c_str());
      continue;
    }
    if (restoreFlags(reg, rec)) restored++;
  }
  return restored;
}

std::string recordsToJSON(const std::vector<ComponentRecord>& records) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("version"); w.Int(kFormatVersion);
  w.Key("components");
  w.StartArray();
  for (const auto& r : records) {
    w.StartObject();
    w.Key("id");   w.String(r.id.c_str(), static_cast<rapidjson::SizeType>(r.id.size()));
    w.Key("kind"); w.String(r.kind.c_str(), static_cast<rapidjson::SizeType>(r.kind.size()));
    w.Key("position");
    w.StartObject();
    w.Key("x"); w.Double(r.position.x);
    w.Key("y"); w.Double(r.position.y);
    w.EndObject();
    w.Key("size");
    w.StartObject();
    w.Key("width");  w.Double(r.size.width);
    w.Key("height"); w.Double(r.size.height);
    w.EndObject();
    w.Key("zOrder");  w.Int(r.zOrder);
    w.Key("locked");  w.Bool(r.locked);
    w.Key("visible"); w.Bool(r.visible);
    w.Key("payload");
    w.String(r.payload.c_str(), static_cast<rapidjson::SizeType>(r.payload.size()));
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

bool recordsFromJSON(const std::string& json, std::vector<ComponentRecord>& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return false;
  if (!doc.IsObject()) return false;
  if (!doc.HasMember("components") || !doc["components"].IsArray()) return false;

  if (doc.HasMember("version") && doc["version"].IsInt() &&
      doc["version"].GetInt() > kFormatVersion) {
    logMessage("Serialization", "format version %d is newer than %d; reading best-effort",
               doc["version"].GetInt(), kFormatVersion);
  }

  const auto& arr = doc["components"].GetArray();

  std::vector<ComponentRecord> loaded;
  loaded.reserve(arr.Size());

  for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
    const auto& v = arr[i];
    if (!v.IsObject()) {
      logMessage("Serialization", "components[%u] is not an object; skipped", i);
      continue;
    }

    ComponentRecord rec;
    rec.id = stringOr(v, "id", "");
    if (rec.id.empty()) {
      logMessage("Serialization", "components[%u] has no id; skipped", i);
      continue;
    }
    rec.kind = stringOr(v, "kind", "unknown");

    if (v.HasMember("position") && v["position"].IsObject()) {
      rec.position.x = numberOr(v["position"], "x", 0.0);
      rec.position.y = numberOr(v["position"], "y", 0.0);
    }
    if (v.HasMember("size") && v["size"].IsObject()) {
      rec.size.width = numberOr(v["size"], "width", 0.0);
      rec.size.height = numberOr(v["size"], "height", 0.0);
    }

    if (v.HasMember("zOrder") && v["zOrder"].IsInt()) {
      rec.zOrder = v["zOrder"].GetInt();
    } else if (v.HasMember("zOrder") && v["zOrder"].IsNumber()) {
      double z = v["zOrder"].GetDouble();
      if (!std::isfinite(z) ||
          z < static_cast<double>(std::numeric_limits<int>::min()) ||
          z > static_cast<double>(std::numeric_limits<int>::max())) {
        logMessage("Serialization", "components[%u] zOrder %g out of range; skipped", i, z);
        continue;
      }
      rec.zOrder = static_cast<int>(z);
    }

    rec.locked = boolOr(v, "locked", false);
    rec.visible = boolOr(v, "visible", true);
    rec.payload = stringOr(v, "payload", "");

    loaded.push_back(std::move(rec));
  }

  out = std::move(loaded);
  return true;
}

} // namespace sc
