export module Decimation;

export import :IndexedMesh;
export import :Quadric;
export import :ConnectivityMesh;
export import :CostModel;
export import :CollapseHeap;
export import :KDTree;
export import :ProximityPairs;
export import :Validation;
export import :Simplification;
