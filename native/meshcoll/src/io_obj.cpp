// io_obj.cpp — Small OBJ reader/writer used as the interchange format between the
// DCC-side scripts and the native collision core. We keep this parser tiny (no
// dependencies) and robust enough for the files DCC exporters usually write.

#include "io_obj.hpp"
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>

// Trim trailing whitespace (incl. CR/LF). OBJ is line-oriented so this is sufficient
// to normalize lines before tokenizing with stringstreams.
static inline void trim(std::string& s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
}

// One `o`/`g` block while reading: vertices it declared and the faces it owns,
// both in file-global 0-based numbering.
struct ObjBlock {
    std::string name;
    std::vector<int> declared;
    std::vector<std::vector<int>> polys;
};

// Re-index a block against its own vertex list: declared vertices first (in
// file order), then any vertex it borrows from another block.
static SourceMesh compact_block(const ObjBlock& b, const std::vector<Vec3>& all) {
    SourceMesh m;
    m.name = b.name;
    std::map<int, int> local;
    auto use = [&](int g) {
        auto it = local.find(g);
        if (it != local.end()) return it->second;
        int idx = (int)m.verts.size();
        local.emplace(g, idx);
        m.verts.push_back(all[g]);
        return idx;
    };
    for (int g : b.declared) use(g);
    for (const auto& poly : b.polys) {
        std::vector<int> p;
        p.reserve(poly.size());
        for (int g : poly) p.push_back(use(g));
        m.polys.push_back(std::move(p));
    }
    return m;
}

bool load_obj(const std::string& path, std::vector<SourceMesh>& out, std::string& err) {
    out.clear(); // ensure target is empty before filling
    std::ifstream ifs(path);
    if (!ifs) { err = "cannot open: " + path; return false; }

    std::vector<Vec3> verts;
    std::vector<ObjBlock> blocks(1);
    blocks[0].name = "mesh";
    std::string line;
    size_t line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        trim(line);
        if (line.empty() || line[0]=='#') continue; // ignore comments/blank lines
        std::istringstream iss(line);
        std::string tok; iss >> tok; // first token is the record type
        if (tok == "v") {
            Vec3 v;
            if (!(iss >> v.x >> v.y >> v.z)) {
                err = path + ":" + std::to_string(line_no) + ": bad vertex record";
                return false;
            }
            blocks.back().declared.push_back((int)verts.size());
            verts.push_back(v);
        } else if (tok == "f") {
            // Face with any number of corners; "12", "12/34", "12/34/56" all give 12.
            std::vector<int> poly;
            std::string s;
            while (iss >> s) {
                size_t p = s.find('/');
                std::string a = (p==std::string::npos)? s : s.substr(0,p);
                char* end = nullptr;
                long idx = std::strtol(a.c_str(), &end, 10);
                if (a.empty() || *end != '\0' || idx == 0) {
                    err = path + ":" + std::to_string(line_no) + ": bad face index '" + s + "'";
                    return false;
                }
                long g = idx > 0 ? idx - 1 : (long)verts.size() + idx;
                if (g < 0 || g >= (long)verts.size()) {
                    err = path + ":" + std::to_string(line_no) + ": face index out of range '" + s + "'";
                    return false;
                }
                poly.push_back((int)g);
            }
            if (poly.size() < 3) {
                err = path + ":" + std::to_string(line_no) + ": face with fewer than 3 corners";
                return false;
            }
            blocks.back().polys.push_back(std::move(poly));
        } else if (tok == "o" || tok == "g") {
            std::string name;
            std::getline(iss >> std::ws, name);
            ObjBlock b;
            b.name = name.empty() ? "mesh_" + std::to_string(blocks.size()) : name;
            blocks.push_back(std::move(b));
        }
        // Other directives (vt, vn, usemtl, mtllib, s, etc.) are ignored.
    }

    for (const auto& b : blocks) {
        if (b.declared.empty() && b.polys.empty()) continue;
        out.push_back(compact_block(b, verts));
    }
    if (out.empty()) { err = "no vertices in: " + path; return false; }
    return true;
}

bool save_obj(const std::string& path, const ProxySet& proxies, std::string& err) {
    std::ofstream ofs(path);
    if (!ofs) { err = "cannot write: " + path; return false; }
    ofs.precision(9);
    ofs << "# meshcoll output\n";
    // OBJ numbering is file-global and 1-based.
    size_t base = 1;
    for (const auto& p : proxies) {
        ofs << "# usage: " << p.usage << '\n';
        ofs << "# layer_preset: " << p.layer_preset << '\n';
        if (!p.parent_bone.empty()) ofs << "# parent_bone: " << p.parent_bone << '\n';
        ofs << "o " << p.name << '\n';
        for (auto& v : p.mesh.verts) {
            ofs << "v " << v.x << ' ' << v.y << ' ' << v.z << '\n';
        }
        for (auto& f : p.mesh.faces) {
            ofs << "f " << (f.a+base) << ' ' << (f.b+base) << ' ' << (f.c+base) << '\n';
        }
        base += p.mesh.verts.size();
    }
    if (!ofs) { err = "write failed: " + path; return false; }
    return true;
}
