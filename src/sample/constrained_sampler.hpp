/**
 * LAEP core.
 *
 * Constrained sampler: jittered lattice restricted to the region union
 */

#ifndef LAEP_SAMPLE_CONSTRAINED_SAMPLER_HPP_
#define LAEP_SAMPLE_CONSTRAINED_SAMPLER_HPP_

#include "region/region_index.hpp"
#include "sample/sample_type.hpp"

#include <random>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

namespace LAEP
{
  namespace SAMPLE
  {
    /**
     * Configuration class for the constrained sampler
     */
    struct SamplerConfig
    {
      /**
       * Constructor of sampler configuration
       * @param cols_arg number of lattice columns
       * @param rows_arg number of lattice rows
       * @param jitter_fraction_arg maximum jitter as a fraction of the cell
       * width/height
       */
      SamplerConfig(int cols_arg = 18, int rows_arg = 12,
                    double jitter_fraction_arg = 0.2);
      int cols;                 /**< lattice columns */
      int rows;                 /**< lattice rows */
      double jitter_fraction;   /**< jitter bound per axis, fraction of cell size */
      int existing_min = 50;    /**< lower bound of existing capacity */
      int existing_max = 500;   /**< upper bound of existing capacity */
      int needed_max = 1000;    /**< upper bound of needed capacity */
      std::string name_prefix = "School Bus Depot"; /**< prefix of point names */
      std::string unknown_label = "Unknown";        /**< label of unresolved points */
      /**
       * Check the configuration, logging every problem found
       */
      bool validate() const;
      void print() const;
      /**
       * Read the configuration from the "config.sampler" node of a
       * property tree (XML, JSON or INI), missing keys keep their default
       */
      static SamplerConfig load_from_ptree(const boost::property_tree::ptree &data);
    };

    /**
     * Generates synthetic facility points over a bounding box, restricted
     * to the union of a region index.
     *
     * The random engine is passed by the caller, for a fixed seed, box,
     * lattice and region set the output is identical across runs.
     */
    class ConstrainedSampler
    {
    public:
      explicit ConstrainedSampler(const SamplerConfig &config = SamplerConfig());
      /**
       * Sample with the lattice size of the configuration
       */
      SamplePoints sample(const REGION::RegionIndex &region_index,
                          const CORE::Box &bbox,
                          std::mt19937 &rng) const;
      /**
       * Build a cols x rows lattice of cells over bbox, jitter each cell
       * center, and keep the points inside the region union.
       *
       * Fewer than cols*rows points is expected: points outside the union
       * are dropped without substitution. Points inside the union that no
       * single region covers keep the unknown label.
       *
       * @param region_index regions restricting the points
       * @param bbox lattice extent
       * @param cols number of columns
       * @param rows number of rows
       * @param rng random engine
       * @return sampled points in row-major lattice order
       * @throw DegenerateInput if bbox has zero area or cols/rows < 1
       */
      SamplePoints sample(const REGION::RegionIndex &region_index,
                          const CORE::Box &bbox, int cols, int rows,
                          std::mt19937 &rng) const;

      const SamplerConfig &get_config() const;

    private:
      SamplerConfig config_;
    };

    /**
     * Keep points whose region is in labels and whose speed category is in
     * speeds. An empty selector keeps everything on that criterion.
     */
    SamplePoints filter_samples(const SamplePoints &points,
                                const std::vector<std::string> &labels,
                                const std::vector<SpeedCategory> &speeds);

  } // SAMPLE
} // LAEP

#endif // LAEP_SAMPLE_CONSTRAINED_SAMPLER_HPP_
