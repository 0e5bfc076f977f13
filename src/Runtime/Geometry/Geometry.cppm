export module Geometry;

export import :Solid;
export import :EdgeKey;
export import :PlaneMath;
export import :FaceGrouping;
export import :BoundaryLoops;
export import :Triangulation;
export import :EdgeTopology;
export import :MeshRepair;
