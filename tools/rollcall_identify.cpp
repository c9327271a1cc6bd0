#include <iostream>
#include <string>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include "rollcall/config.h"
#include "rollcall/encoder.h"
#include "rollcall/errors.h"
#include "rollcall/gallery.h"
#include "rollcall/matcher.h"

// Prints the identity of every face in one image against a gallery.
int main(int argc, char** argv){
    if(argc<3){
        std::cerr<<"usage: rollcall-identify <known_faces_dir> <image> [lbph|onnx] [tolerance]\n";
        return rollcall::kExitUsage;
    }
    rollcall::AppConfig cfg;
    cfg.known_faces_dir = argv[1];
    if(argc>3) cfg.backend = argv[3];

    try {
        if(argc>4) cfg.tolerance = rollcall::parse_tolerance(argv[4]);
        rollcall::validate(cfg);
        spdlog::set_level(spdlog::level::warn);

        auto encoder = rollcall::make_encoder(cfg);
        auto gallery = rollcall::load_known_faces(cfg.known_faces_dir, *encoder);
        rollcall::DistanceMatcher matcher(encoder->metric());

        cv::Mat bgr = cv::imread(argv[2], cv::IMREAD_COLOR);
        if(bgr.empty()){ std::cerr<<"failed to load image\n"; return 4; }
        cv::Mat rgb; cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

        auto boxes = encoder->detect_boxes(rgb);
        auto encodings = encoder->encode_faces(rgb, boxes);
        std::cout<<"gallery="<<gallery.size()<<" faces="<<boxes.size()<<"\n";
        for(size_t i=0;i<boxes.size() && i<encodings.size();++i){
            auto id = rollcall::identify(gallery, matcher, encodings[i], cfg.tolerance);
            std::cout<<"face "<<i<<" box=("<<boxes[i].top<<","<<boxes[i].right<<","
                     <<boxes[i].bottom<<","<<boxes[i].left<<") name="<<id.name
                     <<" distance="<<id.distance<<" match="<<id.matched<<"\n";
        }
        return 0;
    } catch(const rollcall::UsageError& e){
        std::cerr<<e.what()<<"\n";
        return rollcall::kExitUsage;
    } catch(const rollcall::Error& e){
        std::cerr<<rollcall::to_string(e.kind())<<": "<<e.what()<<"\n";
        return rollcall::exit_code(e.kind());
    } catch(const std::exception& e){
        std::cerr<<e.what()<<"\n";
        return 1;
    }
}
