#ifndef STORM_DAMAGE_AGGREGATOR_REGIONS_HPP
#define STORM_DAMAGE_AGGREGATOR_REGIONS_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <geos/geom/Geometry.h>

namespace stormagg {

struct RegionPolygon {
  std::string region_id;
  std::unique_ptr<geos::geom::Geometry> geometry;
};

// Polygon grid plus the coordinate reference system its vertices are in,
// as any definition OGRSpatialReference::SetFromUserInput accepts.
struct RegionLayer {
  std::string crs;
  std::vector<RegionPolygon> regions;
};

struct RegionSource {
  std::string path;
  // Vector layer inside the dataset; the first layer when empty.
  std::string layer_name;
  std::string id_field = "id";
  // CSV sources only: WKT column and the CRS of its coordinates.
  std::string geometry_field = "geometry";
  std::string crs;
};

// True when both definitions describe the same CRS. Throws CrsMismatchError
// when a definition cannot be parsed.
bool sameCrs(const std::string& a, const std::string& b);

// Throws CrsMismatchError unless the layer is in `events_crs`.
void requireSameCrs(const std::string& events_crs, const RegionLayer& layer);

// Returns a copy of `layer` with every polygon transformed into `target_crs`.
RegionLayer reprojectRegionLayer(const RegionLayer& layer, const std::string& target_crs);

// Builds a layer from (id, WKT polygon) pairs.
RegionLayer regionLayerFromWkt(const std::vector<std::pair<std::string, std::string>>& polygons, const std::string& crs);

// Opens any GDAL vector dataset. A path ending in ".csv" is read as a plain
// table with a WKT geometry column instead.
RegionLayer loadRegionLayer(const RegionSource& source);

} // namespace stormagg

#endif
