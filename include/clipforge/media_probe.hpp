/**
 * @file media_probe.hpp
 * @brief Container and stream inspection through libavformat
 *
 * @details LibavProber opens a media file, reads stream info and reports
 *          duration, frame rate and frame size of the best video stream.
 *          Nothing is decoded.
 *
 * @attention THREAD MODEL:
 *            - Every probe() call owns its own AVFormatContext, so one
 *              prober can be shared between worker threads.
 */

#ifndef CLIPFORGE_MEDIA_PROBE_HPP
#define CLIPFORGE_MEDIA_PROBE_HPP

#include <string>

#include "collaborators.hpp"

namespace clipforge {

class LibavProber : public MediaProber {
public:
  /**
   * @brief Probe a file.
   * @return Fatal when the file cannot be opened or has no video stream
   */
  StageOutcome probe(const std::string &path, MediaInfo &out) override;
};

} // namespace clipforge

#endif // CLIPFORGE_MEDIA_PROBE_HPP
