#include "route_registry.h"

namespace claimscan::api {

const std::vector<RouteSpec> kRequiredRoutes = {
    {"GET", "/healthz", "HealthCheck"},
    {"GET", "/readyz", "ReadyCheck"},
    {"GET", "/metrics", "Metrics"},
    {"POST", "/scans", "RunScan"},
    {"GET", "/scans/([a-zA-Z0-9-]+)", "GetScan"},
    {"GET", "/entities/([A-Za-z0-9._-]+)/dossier", "GetDossier"},
    {"GET", "/entities/([A-Za-z0-9._-]+)/peers", "GetPeers"}
};

} // namespace claimscan::api
