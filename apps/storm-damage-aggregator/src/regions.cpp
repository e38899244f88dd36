#include "regions.hpp"

#include <cstddef>
#include <mutex>
#include <sstream>
#include <unordered_set>

#include <cpl_conv.h>
#include <gdal_priv.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <ogrsf_frmts.h>

#include <geos/io/WKBReader.h>
#include <geos/io/WKBWriter.h>
#include <geos/io/WKTReader.h>
#include <geos/util/GEOSException.h>

#include "errors.hpp"
#include "io/table.hpp"

namespace stormagg {

namespace {

using TransformPtr = std::unique_ptr<OGRCoordinateTransformation, void (*)(OGRCoordinateTransformation*)>;

void ensureGdalRegistered() {
  static std::once_flag once;
  std::call_once(once, []() { GDALAllRegister(); });
}

bool endsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

OGRSpatialReference parseCrs(const std::string& definition) {
  OGRSpatialReference srs;
  if (definition.empty() || srs.SetFromUserInput(definition.c_str()) != OGRERR_NONE) {
    throw CrsMismatchError("Unknown coordinate reference system: '" + definition + "'");
  }
  // Events are (x = longitude, y = latitude) regardless of the authority axis order.
  srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
  return srs;
}

std::string describeCrs(const OGRSpatialReference& srs) {
  const char* authority = srs.GetAuthorityName(nullptr);
  const char* code = srs.GetAuthorityCode(nullptr);
  if (authority != nullptr && code != nullptr) {
    return std::string(authority) + ":" + code;
  }

  char* wkt = nullptr;
  const OGRErr result = srs.exportToWkt(&wkt);
  if (result != OGRERR_NONE || wkt == nullptr) {
    CPLFree(wkt);
    throw CrsMismatchError("Region layer CRS cannot be exported");
  }
  std::string definition(wkt);
  CPLFree(wkt);
  return definition;
}

std::string toWkb(const geos::geom::Geometry& geometry) {
  geos::io::WKBWriter writer;
  std::ostringstream output;
  writer.write(geometry, output);
  return output.str();
}

std::string toWkb(const OGRGeometry& geometry) {
  std::string bytes(static_cast<std::size_t>(geometry.WkbSize()), '\0');
  if (geometry.exportToWkb(wkbNDR, reinterpret_cast<unsigned char*>(&bytes[0]), wkbVariantIso) != OGRERR_NONE) {
    throw InputError("Failed to export region geometry");
  }
  return bytes;
}

std::unique_ptr<geos::geom::Geometry> fromWkb(const std::string& bytes, const std::string& region_id) {
  geos::io::WKBReader reader;
  std::istringstream input(bytes);
  try {
    return reader.read(input);
  } catch (const geos::util::GEOSException& error) {
    throw InputError("Invalid geometry for region " + region_id + ": " + error.what());
  }
}

void addRegion(
  RegionLayer& layer,
  std::unordered_set<std::string>& seen,
  std::string region_id,
  std::unique_ptr<geos::geom::Geometry> geometry
) {
  const auto type = geometry->getGeometryTypeId();
  if (type != geos::geom::GEOS_POLYGON && type != geos::geom::GEOS_MULTIPOLYGON) {
    throw InputError("Region " + region_id + " is a " + geometry->getGeometryType() + ", expected a polygon");
  }
  if (!seen.insert(region_id).second) {
    throw InputError("Duplicate region id: " + region_id);
  }
  RegionPolygon region;
  region.region_id = std::move(region_id);
  region.geometry = std::move(geometry);
  layer.regions.push_back(std::move(region));
}

RegionLayer loadCsvRegions(const RegionSource& source) {
  if (source.crs.empty()) {
    throw CrsMismatchError("Region table " + source.path + " needs an explicit CRS");
  }
  const Table table = readCsvFile(source.path, {source.id_field, source.geometry_field});

  std::vector<std::pair<std::string, std::string>> polygons;
  polygons.reserve(table.rows.size());
  for (const auto& row : table.rows) {
    polygons.emplace_back(row[0], row[1]);
  }
  return regionLayerFromWkt(polygons, source.crs);
}

} // namespace

bool sameCrs(const std::string& a, const std::string& b) {
  if (!a.empty() && a == b) {
    return true;
  }
  ensureGdalRegistered();
  const OGRSpatialReference left = parseCrs(a);
  const OGRSpatialReference right = parseCrs(b);
  return left.IsSame(&right) != 0;
}

void requireSameCrs(const std::string& events_crs, const RegionLayer& layer) {
  if (layer.crs.empty()) {
    throw CrsMismatchError("Region layer has no coordinate reference system");
  }
  if (!sameCrs(events_crs, layer.crs)) {
    throw CrsMismatchError("Events are in " + events_crs + " but regions are in " + layer.crs + "; reproject first");
  }
}

RegionLayer reprojectRegionLayer(const RegionLayer& layer, const std::string& target_crs) {
  ensureGdalRegistered();
  OGRSpatialReference source = parseCrs(layer.crs);
  OGRSpatialReference target = parseCrs(target_crs);
  TransformPtr transform(OGRCreateCoordinateTransformation(&source, &target), &OGRCoordinateTransformation::DestroyCT);
  if (!transform) {
    throw CrsMismatchError("No transformation from " + layer.crs + " to " + target_crs);
  }

  RegionLayer projected;
  projected.crs = target_crs;
  projected.regions.reserve(layer.regions.size());
  for (const auto& region : layer.regions) {
    const std::string wkb = toWkb(*region.geometry);
    OGRGeometry* raw = nullptr;
    if (OGRGeometryFactory::createFromWkb(wkb.data(), nullptr, &raw, wkb.size()) != OGRERR_NONE) {
      OGRGeometryFactory::destroyGeometry(raw);
      throw InputError("Failed to convert geometry of region " + region.region_id);
    }
    OGRGeometryUniquePtr geometry(raw);
    if (geometry->transform(transform.get()) != OGRERR_NONE) {
      throw CrsMismatchError("Failed to reproject region " + region.region_id + " into " + target_crs);
    }

    RegionPolygon moved;
    moved.region_id = region.region_id;
    moved.geometry = fromWkb(toWkb(*geometry), region.region_id);
    projected.regions.push_back(std::move(moved));
  }
  return projected;
}

RegionLayer regionLayerFromWkt(const std::vector<std::pair<std::string, std::string>>& polygons, const std::string& crs) {
  RegionLayer layer;
  layer.crs = crs;
  layer.regions.reserve(polygons.size());

  geos::io::WKTReader reader;
  std::unordered_set<std::string> seen;
  for (const auto& polygon : polygons) {
    std::unique_ptr<geos::geom::Geometry> geometry;
    try {
      geometry = reader.read(polygon.second);
    } catch (const geos::util::GEOSException& error) {
      throw InputError("Invalid WKT for region " + polygon.first + ": " + error.what());
    }
    addRegion(layer, seen, polygon.first, std::move(geometry));
  }
  return layer;
}

RegionLayer loadRegionLayer(const RegionSource& source) {
  if (endsWith(source.path, ".csv")) {
    return loadCsvRegions(source);
  }

  ensureGdalRegistered();
  GDALDatasetUniquePtr dataset(
    GDALDataset::Open(source.path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)
  );
  if (!dataset) {
    throw InputError("Failed to open region dataset: " + source.path);
  }

  OGRLayer* ogr_layer =
    source.layer_name.empty() ? dataset->GetLayer(0) : dataset->GetLayerByName(source.layer_name.c_str());
  if (ogr_layer == nullptr) {
    throw InputError("Region dataset " + source.path + " has no layer '" + source.layer_name + "'");
  }

  const OGRSpatialReference* srs = ogr_layer->GetSpatialRef();
  if (srs == nullptr) {
    throw CrsMismatchError("Region layer in " + source.path + " has no coordinate reference system");
  }

  RegionLayer layer;
  layer.crs = describeCrs(*srs);

  const int id_index = ogr_layer->GetLayerDefn()->GetFieldIndex(source.id_field.c_str());
  const bool id_is_fid = id_index < 0 && source.id_field == ogr_layer->GetFIDColumn();
  if (id_index < 0 && !id_is_fid) {
    throw InputError("Region layer in " + source.path + " has no field '" + source.id_field + "'");
  }

  std::unordered_set<std::string> seen;
  ogr_layer->ResetReading();
  OGRFeature* raw = nullptr;
  while ((raw = ogr_layer->GetNextFeature()) != nullptr) {
    OGRFeatureUniquePtr feature(raw);
    const OGRGeometry* geometry = feature->GetGeometryRef();
    if (geometry == nullptr || geometry->IsEmpty()) {
      continue;
    }
    std::string region_id =
      id_is_fid ? std::to_string(feature->GetFID()) : std::string(feature->GetFieldAsString(id_index));
    auto converted = fromWkb(toWkb(*geometry), region_id);
    addRegion(layer, seen, std::move(region_id), std::move(converted));
  }
  return layer;
}

} // namespace stormagg
