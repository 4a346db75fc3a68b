#ifndef A11Y_REGION_EXTRACTOR_HPP
#define A11Y_REGION_EXTRACTOR_HPP

#include "PageContent.hpp"

#include <vector>

namespace a11y {

/// Images narrower or shorter than this (points) are decorative noise
constexpr double kMinImageSize = 10.0;

/// Fraction of the page width/height above which an image counts as full
constexpr double kNearFullPageRatio = 0.98;

/// Distance (points) within which an image edge counts as page-aligned
constexpr double kEdgeAlignTolerance = 1.0;

/**
 * @brief Collect the text-bearing blocks of a page
 *
 * Blocks without a bounding box are skipped.
 *
 * @param page Page content description
 * @return Text blocks in document order
 */
std::vector<RawBlock> extractTextBlocks(const PageContent &page);

/**
 * @brief Collect the image-bearing blocks of a page
 *
 * These are the raw, unfiltered image placements. Blocks without a bounding
 * box are skipped.
 *
 * @param page Page content description
 * @return Image blocks in document order
 */
std::vector<RawBlock> extractImageBlocks(const PageContent &page);

/**
 * @brief Check whether an image is a page background, header/footer band or
 * sidebar
 *
 * Excluded are images that are
 * - near full width and aligned to the top or bottom edge,
 * - near full height and aligned to the left or right edge,
 * - near full width and height and aligned to the top-left corner.
 *
 * @param bbox Image placement
 * @param pageRect Page rectangle
 * @return true if the image should be dropped
 */
bool isBackgroundImage(const Rect &bbox, const Rect &pageRect);

/**
 * @brief Filter the page's image list down to meaningful figures
 *
 * Images whose placement could not be resolved are skipped, as are images
 * below kMinImageSize in either dimension and background images (see
 * isBackgroundImage()).
 *
 * @param page Page content description
 * @return Retained images, in image-list order
 */
std::vector<ImageReference> extractImages(const PageContent &page);

} // namespace a11y

#endif // A11Y_REGION_EXTRACTOR_HPP
