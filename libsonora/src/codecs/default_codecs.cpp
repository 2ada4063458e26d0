#include "../../include/default_codecs.hpp"

namespace sonora {

std::span<const DefaultCodec> default_codecs() {
    static const std::vector<DefaultCodec> kDefaults = {
        {
            "mp3", "MPEG-1 or MPEG-2 Audio Layer III",
            {"mp3"},
            {"lame --quiet -b 320 --vbr-new -ms --replaygain-accurate FILE OUTFILE"},
            {"lame --quiet --decode FILE OUTFILE"},
        },
        {
            "aac", "Advanced Audio Coding",
            {"aac", "m4a", "mp4"},
            {
                "neroAacEnc -if FILE -of OUTFILE -br 256000 -2pass",
                "afconvert -b 256000 -v -f m4af -d aac FILE OUTFILE",
            },
            {
                "neroAacDec -if FILE -of OUTFILE",
                "faad -q -o OUTFILE FILE -b1",
            },
        },
        {
            "vorbis", "Ogg Vorbis",
            {"vorbis", "ogg"},
            {"oggenc --quiet -q 7 -o OUTFILE FILE"},
            {"oggdec --quiet -o OUTFILE FILE"},
        },
        {
            "flac", "Free Lossless Audio Codec",
            {"flac"},
            {"flac -f --silent --verify --replay-gain -o OUTFILE FILE"},
            {"flac -f --silent --decode -o OUTFILE FILE"},
        },
        {
            "wavpack", "WavPack Lossless Audio Codec",
            {"wv", "wavpack"},
            {"wavpack -yhx FILE -o OUTFILE"},
            {"wvunpack -yq FILE -o OUTFILE"},
        },
        {
            "caf", "CoreAudio Format audio",
            {"caf"},
            {"afconvert -f caff -d LEI16 FILE OUTFILE"},
            {"afconvert -f WAVE -d LEI16 FILE OUTFILE"},
        },
        {
            "aif", "AIFF audio",
            {"aif", "aiff"},
            {"afconvert -f AIFF -d BEI16 FILE OUTFILE"},
            {"afconvert -f WAVE -d LEI16 FILE OUTFILE"},
        },
        // raw PCM: the transcoder's intermediate format, no commands needed
        {
            "wav", "RIFF Wave Audio",
            {"wav"},
            {},
            {},
        },
    };
    return kDefaults;
}

} // namespace sonora
