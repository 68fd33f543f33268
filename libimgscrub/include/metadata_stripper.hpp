//
// Created by Giuseppe Francione on 03/12/25.
//

#ifndef IMGSCRUB_METADATA_STRIPPER_HPP
#define IMGSCRUB_METADATA_STRIPPER_HPP

#include "image_buffer.hpp"

namespace imgscrub {

    /**
     * @brief Removes every piece of side information from a buffer.
     *
     * Strip-everything policy: the whole ImageMetadata container is emptied
     * (ICC, EXIF, XMP, text, any other chunk) along with the palette, whatever
     * it contains. There is no list of "sensitive" fields to keep in sync.
     *
     * The buffer is taken by value, so the stripper always mutates storage it
     * exclusively owns; decoders guarantee that storage is not shared with
     * library internals.
     *
     * @return The buffer with metadata.empty() == true.
     */
    ImageBuffer strip_metadata(ImageBuffer buffer);

} // namespace imgscrub

#endif // IMGSCRUB_METADATA_STRIPPER_HPP
