#include <iostream>
#include <geobeam/track_geom.hpp>
#include <geobeam/track_io.hpp>
#include <geobeam/track_player.hpp>
#include <geobeam/viewer/app.hpp>

using namespace geobeam;

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <track.csv>\n";
    return 2;
  }
  const auto samples = load_track_file(argv[1]);
  if (!samples || samples->empty()) {
    std::cerr << "No track samples in " << argv[1] << "\n";
    return 1;
  }

  TrackPlayer player(LocalTrack::FromSamples(*samples));
  player.start();

  ViewerApp app(player, argv[1]);
  const int code = app.run();

  player.stop();
  return code;
}
