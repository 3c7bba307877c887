// qem.cpp — Quadric Error Metrics simplification core (triangle-only).
//
// High-level flow:
// 1) For each triangle, compute its plane equation and derive a 4x4 quadric K = p p^T.
// 2) Accumulate K onto each incident vertex's quadric Q[v]. Open borders get an
//    extra weighted plane perpendicular to the face so they do not shrink.
// 3) Build vertex adjacency / incidence and initialize a min-heap of candidate edges
//    with cost evaluated at the optimal position (small linear solve) or the best of
//    the endpoints and midpoint.
// 4) Repeatedly pop the cheapest edge and collapse v->u, updating vertex position,
//    quadrics, adjacency and affected faces; push updated neighbor edges back.
//    Collapses that fail the link condition, flip a face or duplicate a face are skipped.
// 5) Stop when target face count, time/collapse caps or cancellation are reached;
//    compact arrays.

#include "qem.hpp"
#include <algorithm>
#include <cmath>
#include <chrono>
#include <cstdio>
#include <unordered_set>

static inline void q_zero(Quadric& Q){ for(int i=0;i<16;++i) Q.m[i]=0; }
static inline void q_add(Quadric& A,const Quadric& B){ for(int i=0;i<16;++i) A.m[i]+=B.m[i]; }
static inline Quadric q_sum(const Quadric& A,const Quadric& B){ Quadric C; for(int i=0;i<16;++i) C.m[i]=A.m[i]+B.m[i]; return C; }

// Build a weighted quadric from plane parameters a,b,c,d (ax + by + cz + d = 0): K = w p p^T.
static inline Quadric plane_quadric(double a,double b,double c,double d,double w){
    Quadric K; double p[4]={a,b,c,d};
    int k=0; for(int r=0;r<4;++r) for(int c2=0;c2<4;++c2) K.m[k++]=w*p[r]*p[c2];
    return K;
}

// Solve a 3x3 linear system A x = b with partial pivoting; returns false if near-singular.
// Used to find the point minimizing v'^T Q v' where Q is a merged quadric of an edge's endpoints.
static bool solve3(const double A[9], const double b[3], double x[3]){
    double M[3][4]={{A[0],A[1],A[2],b[0]},{A[3],A[4],A[5],b[1]},{A[6],A[7],A[8],b[2]}};
    for(int i=0;i<3;++i){
        // Pivot on the largest absolute value in the current column to improve stability.
        int piv=i; double pv=std::abs(M[i][i]);
        for(int r=i+1;r<3;++r){ double av=std::abs(M[r][i]); if(av>pv){piv=r; pv=av;} }
        if(pv<1e-12) return false; // treat as singular; caller falls back to endpoints/midpoint
        if(piv!=i) for(int c=0;c<4;++c) std::swap(M[i][c],M[piv][c]);
        double div=M[i][i]; for(int c=0;c<4;++c) M[i][c]/=div;
        for(int r=i+1;r<3;++r){ double f=M[r][i]; for(int c=i;c<4;++c) M[r][c]-=f*M[i][c]; }
    }
    for(int i=2;i>=0;--i){ double s=M[i][3]; for(int c=i+1;c<3;++c) s-=M[i][c]*x[c]; x[i]=s; }
    return true;
}

// Evaluate the quadratic form v^T Q v at homogeneous coordinate v=[x,y,z,1].
static inline double quadric_eval(const Quadric& Q, const Vec3& p){
    double v[4]={p.x,p.y,p.z,1.0};
    double Qv[4]={0,0,0,0}; int k=0;
    for(int r=0;r<4;++r){
        for(int c=0;c<4;++c){ Qv[r]+=Q.m[k++]*v[c]; }
    }
    return v[0]*Qv[0]+v[1]*Qv[1]+v[2]*Qv[2]+v[3]*Qv[3];
}

static inline double clamp(double x,double lo,double hi){ return x<lo?lo:(x>hi?hi:x); }

static inline bool has_vertex(const Tri& f, int v){ return f.a==v || f.b==v || f.c==v; }

static inline Tri replaced(const Tri& f, int from, int to){
    Tri t=f; if(t.a==from) t.a=to; if(t.b==from) t.b=to; if(t.c==from) t.c=to; return t;
}

static inline std::array<int,3> sorted_key(const Tri& f){
    std::array<int,3> k{{f.a,f.b,f.c}}; std::sort(k.begin(),k.end()); return k;
}

static inline void erase_value(std::vector<int>& vec, int value){
    vec.erase(std::remove(vec.begin(), vec.end(), value), vec.end());
}

double decimation_ratio(size_t target, size_t current, double min_ratio){
    double r = std::min(1.0, (double)target / (double)std::max<size_t>(1, current));
    return std::max(min_ratio, r);
}

bool qem_simplify(Mesh& mesh, const SimplifyOptions& opt, SimplifyReport& rep){
    rep = SimplifyReport();
    rep.faces_before = mesh.faces.size();
    rep.verts_before = mesh.verts.size();
    mesh.face_normals.clear();
    if(mesh.faces.empty()) { rep.faces_after=0; rep.verts_after=mesh.verts.size(); return true; }

    // target faces
    int faces0 = (int)mesh.faces.size();
    int target = opt.target_faces>0? opt.target_faces : (int)std::max(0.0, std::floor(faces0 * clamp(opt.ratio,0.0,1.0) + 1e-9));
    int max_collapses = opt.max_collapses>0? opt.max_collapses : (faces0 - target);
    if(max_collapses<0) max_collapses=0;

    const size_t nv = mesh.verts.size();
    std::vector<Quadric> vq(nv);
    for(auto& Q: vq) q_zero(Q);
    std::vector<char> face_alive(mesh.faces.size(), 1);
    std::vector<std::vector<int>> vfaces(nv);
    int faces_cur = 0;
    for(size_t fi=0; fi<mesh.faces.size(); ++fi){
        const Tri& f = mesh.faces[fi];
        if(f.a==f.b || f.b==f.c || f.a==f.c){ face_alive[fi]=0; continue; }
        faces_cur++;
        vfaces[f.a].push_back((int)fi); vfaces[f.b].push_back((int)fi); vfaces[f.c].push_back((int)fi);
        const Vec3& p = mesh.verts[f.a];
        Vec3 n = cross(sub(mesh.verts[f.b],p), sub(mesh.verts[f.c],p));
        double L = len3(n);
        if(L<1e-12) continue; // zero-area faces carry no plane
        n = scale(n, 1.0/L);
        Quadric K = plane_quadric(n.x,n.y,n.z,-dot3(n,p),1.0);
        q_add(vq[f.a], K); q_add(vq[f.b], K); q_add(vq[f.c], K);
    }

    // Border constraints: an edge used by a single face gets a plane through the
    // edge, perpendicular to that face.
    if(opt.boundary_weight>0){
        std::vector<std::pair<std::pair<int,int>,int>> edges;
        for(size_t fi=0; fi<mesh.faces.size(); ++fi){ if(!face_alive[fi]) continue; const Tri& f=mesh.faces[fi];
            int e[3][2]={{f.a,f.b},{f.b,f.c},{f.c,f.a}};
            for(auto& p: e) edges.push_back({{std::min(p[0],p[1]),std::max(p[0],p[1])},(int)fi}); }
        std::sort(edges.begin(), edges.end());
        for(size_t i=0;i<edges.size();){
            size_t j=i; while(j<edges.size() && edges[j].first==edges[i].first) ++j;
            if(j-i==1){
                int a=edges[i].first.first, b=edges[i].first.second;
                Vec3 fn = face_normal(mesh, edges[i].second);
                Vec3 bn = normalized(cross(sub(mesh.verts[b],mesh.verts[a]), fn));
                if(len3(bn)>0){
                    Quadric K = plane_quadric(bn.x,bn.y,bn.z,-dot3(bn,mesh.verts[a]),opt.boundary_weight);
                    q_add(vq[a],K); q_add(vq[b],K);
                }
            }
            i=j;
        }
    }

    // adjacency
    std::vector<std::unordered_set<int>> adj(nv);
    for(size_t fi=0; fi<mesh.faces.size(); ++fi){ if(!face_alive[fi]) continue; const Tri& f=mesh.faces[fi];
        adj[f.a].insert(f.b); adj[f.a].insert(f.c);
        adj[f.b].insert(f.a); adj[f.b].insert(f.c);
        adj[f.c].insert(f.a); adj[f.c].insert(f.b);
    }

    std::vector<unsigned> stamp(nv, 0);
    std::priority_queue<EdgeCand> heap;
    auto push_edge = [&](int u,int v){
        // Canonicalize ordering so each undirected edge is pushed once (u<v).
        if(u==v) return;
        if(u>v) std::swap(u,v);
        if(!adj[u].count(v)) return;
        Quadric Quv = q_sum(vq[u], vq[v]);
        const Vec3& pu = mesh.verts[u]; const Vec3& pv = mesh.verts[v];
        Vec3 mid = scale(add(pu,pv), 0.5);
        // Candidates: endpoints and midpoint, plus the quadric optimum when the
        // system is well conditioned and the optimum stays near the edge.
        Vec3 best = mid; double best_cost = quadric_eval(Quv, mid);
        double cu = quadric_eval(Quv, pu), cv = quadric_eval(Quv, pv);
        if(cu < best_cost){ best=pu; best_cost=cu; }
        if(cv < best_cost){ best=pv; best_cost=cv; }
        double A[9]={Quv.m[0],Quv.m[1],Quv.m[2], Quv.m[4],Quv.m[5],Quv.m[6], Quv.m[8],Quv.m[9],Quv.m[10]};
        double B[3]={-Quv.m[3], -Quv.m[7], -Quv.m[11]};
        double x[3];
        if(solve3(A,B,x)){
            Vec3 opt_p{x[0],x[1],x[2]};
            if(len3(sub(opt_p,mid)) <= len3(sub(pu,pv))){
                double co = quadric_eval(Quv, opt_p);
                if(co < best_cost){ best=opt_p; best_cost=co; }
            }
        }
        heap.push({u,v,std::max(0.0,best_cost),best,stamp[u],stamp[v]});
    };

    for(size_t u=0; u<adj.size(); ++u){ for(int v: adj[u]) if((int)u<v) push_edge((int)u,v); }

    auto is_border_vertex = [&](int w){
        for(int n: adj[w]){
            int shared=0;
            for(int fi: vfaces[w]) if(has_vertex(mesh.faces[fi], n)) ++shared;
            if(shared==1) return true;
        }
        return false;
    };

    // Topology and geometry guards for collapsing v into u at position p.
    auto collapse_ok = [&](int u,int v,const Vec3& p){
        int shared=0;
        for(int fi: vfaces[u]) if(has_vertex(mesh.faces[fi], v)) ++shared;
        if(shared<1 || shared>2) return false;
        int common=0;
        for(int w: adj[u]) if(w!=v && adj[v].count(w)) ++common;
        if(common!=shared) return false;                          // link condition
        if(shared==2 && is_border_vertex(u) && is_border_vertex(v)) return false; // would pinch
        // no face may fold over or become degenerate
        for(int w: {u,v}){
            for(int fi: vfaces[w]){
                const Tri& f = mesh.faces[fi];
                if(has_vertex(f,u) && has_vertex(f,v)) continue;
                Vec3 n0 = face_normal(mesh, fi);
                if(len3(n0)==0) continue;
                Vec3 q[3]={mesh.verts[f.a],mesh.verts[f.b],mesh.verts[f.c]};
                if(f.a==w) q[0]=p; if(f.b==w) q[1]=p; if(f.c==w) q[2]=p;
                Vec3 n1 = normalized(cross(sub(q[1],q[0]), sub(q[2],q[0])));
                if(dot3(n0,n1) <= 0.0) return false;
            }
        }
        // no duplicate face after rewiring v -> u
        for(int fv: vfaces[v]){
            const Tri& f = mesh.faces[fv];
            if(has_vertex(f,u)) continue;
            auto key = sorted_key(replaced(f,v,u));
            for(int fu: vfaces[u]) if(sorted_key(mesh.faces[fu])==key) return false;
        }
        return true;
    };

    auto t0 = std::chrono::steady_clock::now();
    int collapsed=0;
    int next_progress = opt.progress_interval;
    std::vector<char> v_alive(nv, 1);

    while(faces_cur>target && !heap.empty() && collapsed<max_collapses){
        if(is_cancelled(opt.cancel)){ rep.cancelled=true; break; }
        // time limit
        if(opt.time_limit>0){
            auto dt = std::chrono::duration<double>(std::chrono::steady_clock::now()-t0).count();
            if(dt >= opt.time_limit){ rep.timed_out=true; break; }
        }

        auto e = heap.top(); heap.pop();
        int u=e.u, v=e.v;
        if(!v_alive[u] || !v_alive[v]) continue;
        if(stamp[u]!=e.su || stamp[v]!=e.sv) continue; // stale entry
        if(!adj[u].count(v)) continue;
        if(!collapse_ok(u,v,e.pos)){ rep.rejected++; continue; }

        mesh.verts[u] = e.pos;
        q_add(vq[u], vq[v]);

        // update faces: faces on the edge die, the rest of v's faces move to u
        for(int fi: std::vector<int>(vfaces[v])){
            Tri& f = mesh.faces[fi];
            if(has_vertex(f,u)){
                face_alive[fi]=0; faces_cur--;
                erase_value(vfaces[f.a],fi); erase_value(vfaces[f.b],fi); erase_value(vfaces[f.c],fi);
            }else{
                f = replaced(f,v,u);
                vfaces[u].push_back(fi);
            }
        }
        vfaces[v].clear();

        // rewire adjacency: move neighbors of v to u
        for(int w: adj[v]){ if(w==u) continue; adj[w].erase(v); adj[w].insert(u); adj[u].insert(w); }
        adj[u].erase(v);
        adj[v].clear(); v_alive[v]=0;
        // neighbors that lost their last face with u are no longer adjacent
        for(int w: std::vector<int>(adj[u].begin(), adj[u].end())){
            bool linked=false;
            for(int fi: vfaces[u]) if(has_vertex(mesh.faces[fi],w)){ linked=true; break; }
            if(!linked){ adj[u].erase(w); adj[w].erase(u); }
        }
        stamp[u]++;

        // refresh candidate edges around u
        for(int w: adj[u]) push_edge(u,w);

        ++collapsed;
        if(opt.progress_interval>0 && collapsed >= next_progress){
            fprintf(stderr, "[meshcoll] collapsed=%d faces_now=%d target=%d\n", collapsed, faces_cur, target);
            next_progress += opt.progress_interval;
        }
    }
    rep.collapses = collapsed;

    // compact vertices and faces — remove dead vertices and reindex faces.
    std::vector<int> remap(nv, -1);
    std::vector<Vec3> v2; v2.reserve(nv);
    for(size_t i=0;i<nv;++i){ if(v_alive[i]){ remap[i]=(int)v2.size(); v2.push_back(mesh.verts[i]); } }
    std::vector<Tri> f2; f2.reserve(mesh.faces.size());
    for(size_t fi=0; fi<mesh.faces.size(); ++fi){ if(!face_alive[fi]) continue; const Tri& f=mesh.faces[fi];
        int a=remap[f.a], b=remap[f.b], c=remap[f.c]; if(a<0||b<0||c<0) continue; f2.push_back({a,b,c}); }
    mesh.verts.swap(v2); mesh.faces.swap(f2);

    rep.faces_after = mesh.faces.size();
    rep.verts_after = mesh.verts.size();
    return !rep.cancelled;
}
