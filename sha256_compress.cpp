#include "sha256_compress.hpp"

namespace shaforge {

HashState compressBlock(const HashState& state, const Schedule& schedule, const RoundConstants& constants) {
    Word a = state[0];
    Word b = state[1];
    Word c = state[2];
    Word d = state[3];
    Word e = state[4];
    Word f = state[5];
    Word g = state[6];
    Word h = state[7];

    for (int t = 0; t < 64; t++) {
        Word T1 = bigSigma1(e) + choose(e, f, g) + h + constants[t] + schedule[t];
        Word T2 = bigSigma0(a) + majority(a, b, c);
        h = g;
        g = f;
        f = e;
        e = d + T1;
        d = c;
        c = b;
        b = a;
        a = T1 + T2;
    }

    HashState out = state;
    out[0] += a;
    out[1] += b;
    out[2] += c;
    out[3] += d;
    out[4] += e;
    out[5] += f;
    out[6] += g;
    out[7] += h;
    return out;
}

void sha256_compress(const Block& block, HashState& state) {
    state = compressBlock(state, expand(block), roundConstants());
}

} // namespace shaforge
