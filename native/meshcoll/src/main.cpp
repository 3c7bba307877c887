// main.cpp — Command-line wrapper around the collision core.
//
// Responsibilities:
// - Parse flags (inputs, output, method/target/offset, tagging, sampling caps,
//   simplifier limits) and the two helper modes --wheels / --center-of-mass.
// - Load input OBJ objects, run generate_collision (or the helper), save the
//   proxies as OBJ objects.
// - Print a short summary to stdout so DCC-side scripts can parse it.

#include "io_obj.hpp"
#include "collision.hpp"
#include "wheels.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

static void usage(){
    fprintf(stderr, "meshcoll (v%s)\n", MCL_VERSION);
    fprintf(stderr, "Usage: meshcoll --in in.obj [--in more.obj ...] --out out.obj [options]\n");
    fprintf(stderr, "  --method ucx|ucl|ubx|usp|utm   --target-faces n   --offset t\n");
    fprintf(stderr, "  --preserve-details 0|1   --flat-min-ratio r   --merge   --share-target   --name-stem s   --parent-bone s\n");
    fprintf(stderr, "  --category weapon|vehicle|building   --layer-preset s   --usage s\n");
    fprintf(stderr, "  --per-mesh-cap n   --aggregate-cap n   --time-limit s   --progress-interval n   --verbose\n");
    fprintf(stderr, "  --wheels [--radius-offset r] [--width-offset w]\n");
    fprintf(stderr, "  --center-of-mass [--com-size s] [--com-height h]   (no --in needed)\n");
}

// Strict numeric parsing: the whole token must be consumed.
static bool to_double(const char* s, double& v){
    char* end=nullptr; v=std::strtod(s, &end);
    return end!=s && *end=='\0';
}
static bool to_int(const char* s, int& v){
    char* end=nullptr; long l=std::strtol(s, &end, 10);
    v=(int)l;
    return end!=s && *end=='\0';
}

int main(int argc, char** argv){
    std::vector<std::string> in_paths; const char* out_path=nullptr;
    CollisionRequest req;
    WheelOptions wheel;
    bool wheels=false, com=false;
    double com_size=0.15, com_height=-0.15;
    int caps[2]={(int)req.sampling.per_mesh_cap, (int)req.sampling.aggregate_cap};
    bool ok=true;
    for(int i=1;i<argc && ok;i++){
        const char* a=argv[i];
        bool has_val = i+1<argc;
        if(!strcmp(a,"--in") && has_val) in_paths.push_back(argv[++i]);
        else if(!strcmp(a,"--out") && has_val) out_path=argv[++i];
        else if(!strcmp(a,"--method") && has_val) ok=parse_method(argv[++i], req.method);
        else if(!strcmp(a,"--target-faces") && has_val) ok=to_int(argv[++i], req.target_face_count);
        else if(!strcmp(a,"--offset") && has_val) ok=to_double(argv[++i], req.offset_thickness);
        else if(!strcmp(a,"--preserve-details") && has_val){ int v=0; ok=to_int(argv[++i], v); req.preserve_details = v!=0; }
        else if(!strcmp(a,"--merge")) req.merge_sources=true;
        else if(!strcmp(a,"--share-target")) req.share_target_across_parts=true;
        else if(!strcmp(a,"--name-stem") && has_val) req.name_stem=argv[++i];
        else if(!strcmp(a,"--parent-bone") && has_val) req.parent_bone=argv[++i];
        else if(!strcmp(a,"--flat-min-ratio") && has_val) ok=to_double(argv[++i], req.flat_min_ratio);
        else if(!strcmp(a,"--category") && has_val) ok=parse_category(argv[++i], req.category);
        else if(!strcmp(a,"--layer-preset") && has_val){ req.layer_preset=argv[++i]; wheel.layer_preset=req.layer_preset; }
        else if(!strcmp(a,"--usage") && has_val) req.usage=argv[++i];
        else if(!strcmp(a,"--per-mesh-cap") && has_val) ok=to_int(argv[++i], caps[0]) && caps[0]>0;
        else if(!strcmp(a,"--aggregate-cap") && has_val) ok=to_int(argv[++i], caps[1]) && caps[1]>0;
        else if(!strcmp(a,"--time-limit") && has_val) ok=to_double(argv[++i], req.time_limit);
        else if(!strcmp(a,"--progress-interval") && has_val) ok=to_int(argv[++i], req.progress_interval);
        else if(!strcmp(a,"--verbose")) req.verbose=true;
        else if(!strcmp(a,"--wheels")) wheels=true;
        else if(!strcmp(a,"--radius-offset") && has_val) ok=to_double(argv[++i], wheel.radius_offset);
        else if(!strcmp(a,"--width-offset") && has_val) ok=to_double(argv[++i], wheel.width_offset);
        else if(!strcmp(a,"--center-of-mass")) com=true;
        else if(!strcmp(a,"--com-size") && has_val) ok=to_double(argv[++i], com_size);
        else if(!strcmp(a,"--com-height") && has_val) ok=to_double(argv[++i], com_height);
        else { fprintf(stderr, "Unknown or incomplete option: %s\n", a); usage(); return 2; }
        if(!ok){ fprintf(stderr, "Bad value for option: %s\n", a); usage(); return 2; }
    }
    if(!out_path || (in_paths.empty() && !com) || (wheels && com)){ usage(); return 2; }
    req.sampling.per_mesh_cap=(size_t)caps[0];
    req.sampling.aggregate_cap=(size_t)caps[1];

    ProxySet proxies; std::string err;
    size_t src_faces=0;
    if(com){
        proxies.push_back(make_center_of_mass(com_size, com_height));
    } else {
        std::vector<SourceMesh> sources;
        for(const auto& p : in_paths){
            std::vector<SourceMesh> loaded;
            if(!load_obj(p, loaded, err)){ fprintf(stderr, "Load error: %s\n", err.c_str()); return 3; }
            sources.insert(sources.end(), loaded.begin(), loaded.end());
        }
        for(const auto& s : sources) src_faces += s.num_triangles();

        if(wheels){
            for(const auto& s : sources){
                ProxyMesh p; CollisionStatus st;
                if(!make_wheel_collision(s, wheel, p, st)){
                    fprintf(stderr, "Generation error: %s: %s\n", errc_name(st.code), st.message.c_str());
                    return 4;
                }
                proxies.push_back(std::move(p));
            }
        } else {
            CollisionStatus st;
            if(!generate_collision(sources, req, proxies, st)){
                fprintf(stderr, "Generation error: %s: %s\n", errc_name(st.code), st.message.c_str());
                return 4;
            }
        }
    }

    if(!save_obj(out_path, proxies, err)){ fprintf(stderr, "Save error: %s\n", err.c_str()); return 5; }

    // The summary is parsed by DCC-side scripts; avoid extra stdout noise here.
    size_t out_faces=0;
    for(const auto& p : proxies) out_faces += p.mesh.faces.size();
    fprintf(stdout, "proxies: %zu\nfaces: %zu -> %zu\n", proxies.size(), src_faces, out_faces);
    for(const auto& p : proxies) fprintf(stdout, "%s %zu\n", p.name.c_str(), p.mesh.faces.size());
    return 0;
}
