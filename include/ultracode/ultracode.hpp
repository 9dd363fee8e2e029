#ifndef ULTRACODE_ULTRACODE_HPP_
#define ULTRACODE_ULTRACODE_HPP_

#include <ultracode/ultracode_export.h>
#include <ultracode/types.hpp>
#include <ultracode/gray_image.hpp>
#include <ultracode/sampler.hpp>
#include <ultracode/binarizer.hpp>
#include <ultracode/matcher.hpp>
#include <ultracode/area_decoder.hpp>
#include <ultracode/scanner.hpp>
#include <ultracode/render.hpp>
#include <ultracode/symbologies/ean13.hpp>
#include <ultracode/symbologies/code128.hpp>

namespace ultracode {

// All public API is included via the headers above.
// See:
//   - types.hpp:        barcode_format, decode_options, decode_result, decoded_symbol
//   - gray_image.hpp:   gray_image view, gray_buffer
//   - scanner.hpp:      decode_any(), decode_first(), scanner
//   - matcher.hpp:      built-in matcher table
//   - area_decoder.hpp: 2D decoder interface
//   - render.hpp:       module sequences and rasterization
//
// Image file loading and saving (image_io.hpp) is a separate library,
// ultracode_image_io, and is not included here.

} // namespace ultracode

#endif // ULTRACODE_ULTRACODE_HPP_
