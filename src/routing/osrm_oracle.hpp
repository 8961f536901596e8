/**
 * LAEP core.
 *
 * Routing oracle client for an OSRM compatible route service
 */

#ifndef LAEP_ROUTING_OSRM_ORACLE_HPP_
#define LAEP_ROUTING_OSRM_ORACLE_HPP_

#include "routing/routing_oracle.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <boost/property_tree/ptree.hpp>

namespace LAEP
{
  namespace ROUTING
  {

    /**
     * Response of a HTTP GET
     */
    struct HttpResponse
    {
      int status;       /**< HTTP status code */
      std::string body; /**< response body */
    };

    /**
     * HTTP transport used by the OSRM client. The transport owns
     * connection handling, retries and authentication; it may throw on
     * network errors and timeouts.
     */
    class HttpTransport
    {
    public:
      virtual ~HttpTransport() = default;
      virtual HttpResponse get(const std::string &url,
                               std::chrono::milliseconds timeout) = 0;
    };

    /**
     * Configuration of the OSRM client
     */
    struct OsrmConfig
    {
      std::string base_url = "https://router.project-osrm.org/route/v1/driving";
      bool validate() const;
      void print() const;
      static OsrmConfig load_from_ptree(const boost::property_tree::ptree &data);
    };

    /**
     * Routing oracle querying the route endpoint of OSRM.
     *
     * Transport exceptions, non-200 statuses, a code other than "Ok", an
     * empty route list and unparsable bodies are all translated into
     * failure replies; nothing escapes route().
     */
    class OsrmRoutingOracle : public RoutingOracle
    {
    public:
      OsrmRoutingOracle(std::shared_ptr<HttpTransport> transport,
                        const OsrmConfig &config = OsrmConfig());

      OracleReply route(const CORE::Point &origin,
                        const CORE::Point &destination,
                        std::chrono::milliseconds timeout) override;

      /**
       * URL of a route query with full overview and GeoJSON geometry
       */
      std::string build_url(const CORE::Point &origin,
                            const CORE::Point &destination) const;

      /**
       * Translate the body of a 200 response. Missing duration or
       * distance default to 0.
       */
      static OracleReply parse_response(const std::string &body);

    private:
      std::shared_ptr<HttpTransport> transport_;
      OsrmConfig config_;
    };

  } // ROUTING
} // LAEP

#endif // LAEP_ROUTING_OSRM_ORACLE_HPP_
